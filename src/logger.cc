#include <coderun/errmsg.hh>
#include <coderun/logger.hh>
#include <coderun/macros/throw.hh>
#include <coderun/time.hh>
#include <exception>
#include <string_view>

namespace {

FILE* open_log_file(const char* filename) {
    FILE* f = fopen(filename, "ae");
    if (f == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }
    return f;
}

// Writes one line, the caller has to hold the lock of @p f
void write_line(FILE* f, bool with_label, std::string_view line) noexcept {
    auto len = static_cast<int>(line.size());
    if (not with_label) {
        (void)fprintf(f, "%.*s\n", len, line.data());
        return;
    }
    try {
        (void)fprintf(f, "[ %s ] %.*s\n", local_datetime().c_str(), len, line.data());
    } catch (const std::exception&) {
        (void)fprintf(f, "[ unknown time ] %.*s\n", len, line.data());
    }
}

} // namespace

Logger::Logger(const char* filename) : f_(open_log_file(filename)), opened_(true) {}

void Logger::open(const char* filename) {
    FILE* f = open_log_file(filename);
    close();
    f_ = f;
    opened_ = true;
}

void Logger::Appender::flush() noexcept {
    if (flushed_) {
        return;
    }
    if (logger_.lock()) {
        write_line(logger_.f_, label_, buff_);
        (void)fflush(logger_.f_);
        logger_.unlock();
    }
    flushed_ = true;
    buff_.clear();
}
