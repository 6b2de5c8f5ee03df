#pragma once

#include <string>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace mg::crypto::util {

// RFC 4122 v4 UUID, lowercase hex with dashes
inline std::string uuid4_hex() {
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

}
