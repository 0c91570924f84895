#pragma once

#include <atomic>
#include <chrono>
#include <dtop/core/event.hpp>
#include <dtop/core/task.hpp>
#include <dtop/ui/screen.hpp>
#include <memory>

namespace dtop {
namespace ui {

constexpr std::chrono::milliseconds KEY_POLL_INTERVAL{20};

/**
 * @brief Background producer turning keystrokes into intents
 */
class KeyboardReader {
public:
    KeyboardReader(Screen& screen, EventSender sender);
    ~KeyboardReader();

    KeyboardReader(const KeyboardReader&) = delete;
    KeyboardReader& operator=(const KeyboardReader&) = delete;

    void start();

    // Cancels the reader and waits for it; the screen may be torn down afterwards
    void stop();

    /**
     * @brief Route keys to the search editor; kept in sync by the renderer
     */
    void setTextEntry(bool enabled)
    {
        text_entry_->store(enabled);
    }

private:
    Screen& screen_;
    EventSender sender_;
    std::shared_ptr<std::atomic<bool>> text_entry_;
    Task task_;
};

} // namespace ui
} // namespace dtop
