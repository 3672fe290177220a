#include "http_utils.hpp"
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace http_utils {

std::string getHttpDate() {
    std::time_t now = std::time(nullptr);
    std::tm tm = {};
    gmtime_r(&now, &tm);
    std::stringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    return ss.str();
}

}
