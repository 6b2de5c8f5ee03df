#include "util/timestamp.hpp"

#include <iomanip>
#include <sstream>

namespace mg::util {

std::string toIsoString(const SysTime tp) {
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(tp.time_since_epoch());
    auto secs = duration_cast<seconds>(ms);
    auto frac = ms - secs;
    if (frac.count() < 0) {
        frac += seconds(1);
        secs -= seconds(1);
    }

    const std::time_t t = secs.count();
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << frac.count() << 'Z';
    return oss.str();
}

std::optional<SysTime> parseIsoString(const std::string& iso) {
    std::tm tm{};
    std::istringstream ss(iso.substr(0, 19)); // "YYYY-MM-DDTHH:MM:SS"
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) return std::nullopt;

    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));

    if (iso.size() > 20 && iso[19] == '.') {
        const auto end = iso.find_first_not_of("0123456789", 20);
        auto digits = iso.substr(20, end == std::string::npos ? std::string::npos : end - 20);
        digits.resize(3, '0');
        tp += std::chrono::milliseconds(std::stoi(digits));
    }

    return tp;
}

std::optional<SysTime> parseHttpDate(const std::string& date) {
    std::tm tm{};
    std::istringstream ss(date);
    ss.imbue(std::locale::classic());
    ss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
    if (ss.fail()) return std::nullopt;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

}
