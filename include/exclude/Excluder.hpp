#pragma once

#include <string_view>

namespace ci::exclude {

// Anything that can veto a path from the backup set
class Excluder {
public:
    virtual ~Excluder() = default;
    [[nodiscard]] virtual bool excludes(std::string_view path) const = 0;
};

}
