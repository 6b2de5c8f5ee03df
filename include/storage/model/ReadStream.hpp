#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace mg::storage::model {

struct ReadStream {
    std::unique_ptr<std::istream> stream;
    std::optional<uintmax_t> length;
    std::optional<std::string> type;
};

struct ReadOptions {
    uintmax_t position = 0;
    std::optional<uintmax_t> length;
};

}
