/**
 * @file shim_main.cpp
 * @brief cloudlet_shim: runs a shared-library function in its own process.
 *
 *   cloudlet_shim <library> <symbol>            invoke: stdin → entry → stdout
 *   cloudlet_shim --verify <library> <symbol>   resolve only
 *
 * Running the library out of process keeps a crashing or hanging function
 * from taking the host with it, and lets the host kill it on timeout.
 */

#include "executor/function_abi.hpp"

#include <dlfcn.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace {

constexpr int kUsageError = 64;
constexpr int kLoadError = 65;
constexpr int kIoError = 66;

void* open_library(const char* path) {
    void* handle = ::dlopen(path, RTLD_NOW | RTLD_LOCAL);
    if (handle == nullptr) {
        const char* why = ::dlerror();
        std::fprintf(stderr, "dlopen failed: %s\n", why != nullptr ? why : "unknown error");
    }
    return handle;
}

cloudlet_entry_fn resolve(void* handle, const char* symbol) {
    ::dlerror();
    void* sym = ::dlsym(handle, symbol);
    const char* why = ::dlerror();
    if (why != nullptr || sym == nullptr) {
        std::fprintf(stderr, "dlsym(%s) failed: %s\n", symbol,
                     why != nullptr ? why : "symbol is null");
        return nullptr;
    }
    return reinterpret_cast<cloudlet_entry_fn>(sym);
}

bool read_stdin(std::vector<uint8_t>& out) {
    uint8_t buf[64 * 1024];
    while (true) {
        ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n > 0) {
            out.insert(out.end(), buf, buf + n);
            continue;
        }
        if (n == 0) return true;
        if (errno == EINTR) continue;
        return false;
    }
}

bool write_fd(int fd, const uint8_t* data, size_t size) {
    while (size > 0) {
        ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    bool verify_only = false;
    int first = 1;
    if (argc > 1 && std::strcmp(argv[1], "--verify") == 0) {
        verify_only = true;
        first = 2;
    }
    if (argc - first != 2) {
        std::fprintf(stderr, "Usage: cloudlet_shim [--verify] <library> <symbol>\n");
        return kUsageError;
    }
    const char* library = argv[first];
    const char* symbol = argv[first + 1];

    void* handle = open_library(library);
    if (handle == nullptr) return kLoadError;

    cloudlet_entry_fn entry = resolve(handle, symbol);
    if (entry == nullptr) {
        ::dlclose(handle);
        return kLoadError;
    }
    if (verify_only) {
        ::dlclose(handle);
        return 0;
    }

    std::vector<uint8_t> input;
    if (!read_stdin(input)) {
        std::fprintf(stderr, "reading input failed: %s\n", std::strerror(errno));
        return kIoError;
    }

    uint8_t* output = nullptr;
    size_t output_len = 0;
    int rc = entry(input.data(), input.size(), &output, &output_len);

    bool written = true;
    if (output != nullptr && output_len > 0) {
        // A failing function's output is its error message.
        written = write_fd(rc == 0 ? STDOUT_FILENO : STDERR_FILENO, output, output_len);
    }
    std::free(output);

    if (!written) return kIoError;
    if (rc == 0) return 0;
    int code = rc & 0xff;
    return code == 0 ? 1 : code;
}
