#include <array>
#include <coderun/errmsg.hh>
#include <coderun/macros/throw.hh>
#include <coderun/time.hh>
#include <ctime>

std::string local_datetime() {
    time_t curr_time = time(nullptr);
    if (curr_time == static_cast<time_t>(-1)) {
        THROW("time()", errmsg());
    }

    struct tm t = {};
    if (localtime_r(&curr_time, &t) == nullptr) {
        THROW("localtime_r()", errmsg());
    }

    std::array<char, 32> buff{};
    size_t len = strftime(buff.data(), buff.size(), "%Y-%m-%d %H:%M:%S", &t);
    if (len == 0) {
        THROW("strftime() failed");
    }
    return std::string(buff.data(), len);
}
