#include <dtop/engine/search_input.hpp>

namespace dtop {
namespace engine {

bool SearchInput::handle(const KeyInput& key)
{
    switch (key.code) {
        case KeyInput::Code::Char:
            if (key.ch == '\0') {
                return false;
            }
            value_.insert(cursor_, 1, key.ch);
            ++cursor_;
            return true;
        case KeyInput::Code::Backspace:
            if (cursor_ == 0) {
                return false;
            }
            value_.erase(--cursor_, 1);
            return true;
        case KeyInput::Code::Delete:
            if (cursor_ >= value_.size()) {
                return false;
            }
            value_.erase(cursor_, 1);
            return true;
        case KeyInput::Code::Left:
            if (cursor_ > 0) {
                --cursor_;
            }
            return false;
        case KeyInput::Code::Right:
            if (cursor_ < value_.size()) {
                ++cursor_;
            }
            return false;
        case KeyInput::Code::Home:
            cursor_ = 0;
            return false;
        case KeyInput::Code::End:
            cursor_ = value_.size();
            return false;
        case KeyInput::Code::Enter:
        case KeyInput::Code::Esc:
            return false;
    }
    return false;
}

void SearchInput::reset()
{
    value_.clear();
    cursor_ = 0;
}

} // namespace engine
} // namespace dtop
