#include <ncurses.h>
#include <dtop/core/logger.hpp>
#include <dtop/ui/key_map.hpp>
#include <dtop/ui/keyboard.hpp>

namespace dtop {
namespace ui {

KeyboardReader::KeyboardReader(Screen& screen, EventSender sender)
    : screen_(screen), sender_(std::move(sender)), text_entry_(std::make_shared<std::atomic<bool>>(false))
{}

KeyboardReader::~KeyboardReader()
{
    stop();
}

void KeyboardReader::start()
{
    Screen* screen = &screen_;
    EventSender sender = sender_;
    auto text_entry = text_entry_;

    task_ = Task::spawn("keyboard", [screen, sender, text_entry](CancelToken& token) mutable {
        while (!token.isCancelled()) {
            int ch = screen->pollKey();
            if (ch == ERR) {
                token.sleepFor(KEY_POLL_INTERVAL);
                continue;
            }

            bool entering_text = text_entry->load();
            std::vector<AppEvent> intents = mapKey(ch, entering_text);
            for (auto& intent : intents) {
                // Switch modes right away so fast typing after '/' is not read as commands
                if (std::holds_alternative<events::EnterSearchMode>(intent)) {
                    text_entry->store(true);
                }
                else if (entering_text && (std::holds_alternative<events::EnterPressed>(intent) ||
                                           std::holds_alternative<events::ExitView>(intent))) {
                    text_entry->store(false);
                }

                if (!sender.send(std::move(intent))) {
                    return;
                }
            }
        }
    });
}

void KeyboardReader::stop()
{
    task_.cancel();
    task_.join();
}

} // namespace ui
} // namespace dtop
