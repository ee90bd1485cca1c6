#pragma once
// System clipboard access used by the clipboard plugin and the monitor

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace clipfolio {

class ClipboardBackend {
public:
    virtual ~ClipboardBackend() = default;

    // nullopt when the clipboard holds no text
    virtual std::optional<std::string> readText() = 0;
    virtual bool writeText(std::string_view text) = 0;

    // Raw PNG bytes; nullopt when the clipboard holds no image
    virtual std::optional<std::string> readImage() = 0;
    virtual bool writeImage(std::string_view pngBytes) = 0;
};

// wl-clipboard (wl-copy / wl-paste) on Wayland sessions
class WlClipboard : public ClipboardBackend {
public:
    std::optional<std::string> readText() override;
    bool writeText(std::string_view text) override;
    std::optional<std::string> readImage() override;
    bool writeImage(std::string_view pngBytes) override;

private:
    // MIME types currently offered, one per line
    std::string offeredTypes();
};

} // namespace clipfolio
