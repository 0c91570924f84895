#pragma once

#include <cstddef>
#include <dtop/core/event.hpp>
#include <string>

namespace dtop {
namespace engine {

/**
 * @brief Single-line text editor behind the container search box
 */
class SearchInput {
public:
    /**
     * @brief Apply a key; Enter and Esc are not handled here
     * @return true if the text changed
     */
    bool handle(const KeyInput& key);

    void reset();

    const std::string& value() const
    {
        return value_;
    }
    size_t cursor() const
    {
        return cursor_;
    }

private:
    std::string value_;
    size_t cursor_ = 0;
};

} // namespace engine
} // namespace dtop
