#include <cerrno>
#include <coderun/errmsg.hh>
#include <coderun/macros/throw.hh>
#include <coderun/random.hh>
#include <sys/random.h>

void fill_randomly(void* dest, size_t bytes) {
    auto* dest_bytes = static_cast<unsigned char*>(dest);
    while (bytes > 0) {
        ssize_t len = getrandom(dest_bytes, bytes, 0);
        if (len >= 0) {
            dest_bytes += len;
            bytes -= len;
        } else if (errno != EINTR) {
            THROW("getrandom()", errmsg());
        }
    }
}
