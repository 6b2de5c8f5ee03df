#pragma once

#include <string>

namespace mg::storage::s3 {

// Resolved per endpoint host, immutable once a client holds it.
struct Credentials {
    std::string accessKey;
    std::string secretKey;
    std::string region;
    std::string endpoint; // scheme://host
};

}
