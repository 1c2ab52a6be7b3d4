#include "prism/sdk.h"
#include "prism/interception.h"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace prism::sdk {

namespace fs = std::filesystem;

static std::ios::openmode parse_mode(const std::string& mode) {
    std::string m;
    bool binary = false;
    for (char c : mode) {
        if (c == 'b') binary = true;
        else m.push_back(c);
    }
    std::ios::openmode om;
    if (m == "r") om = std::ios::in;
    else if (m == "w") om = std::ios::out | std::ios::trunc;
    else if (m == "a") om = std::ios::out | std::ios::app;
    else if (m == "r+") om = std::ios::in | std::ios::out;
    else if (m == "w+") om = std::ios::in | std::ios::out | std::ios::trunc;
    else if (m == "a+") om = std::ios::in | std::ios::out | std::ios::app;
    else throw std::invalid_argument("unsupported open mode: " + mode);
    if (binary) om |= std::ios::binary;
    return om;
}

std::fstream open_file(const fs::path& path, const std::string& mode) {
    const auto om = parse_mode(mode);
    OperationArgs args;
    args.path = path;
    args.mode = mode;
    enforce(events::kOpen, args);

    std::fstream f(path, om);
    if (!f.is_open()) throw std::runtime_error("cannot open " + path.string());
    return f;
}

std::string read_file(const fs::path& path) {
    auto f = open_file(path, "rb");
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void write_file(const fs::path& path, const std::string& data, bool append) {
    auto f = open_file(path, append ? "ab" : "wb");
    f.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!f) throw std::runtime_error("write failed: " + path.string());
}

void rename_file(const fs::path& from, const fs::path& to) {
    OperationArgs args;
    args.path = from;
    args.path2 = to;
    enforce(events::kRename, args);
    fs::rename(from, to);
}

void remove_file(const fs::path& path) {
    OperationArgs args;
    args.path = path;
    enforce(events::kRemove, args);
    fs::remove(path);
}

int connect_tcp(const std::string& host, int port) {
    OperationArgs args;
    args.host = host;
    args.port = port;
    enforce(events::kConnect, args);

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    const std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) throw std::runtime_error("getaddrinfo(" + host + "): " + gai_strerror(rc));

    int fd = -1;
    std::string last_err = "no addresses";
    for (auto* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_err = std::strerror(errno);
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
        last_err = std::strerror(errno);
        ::close(fd);
        fd = -1;
    }
    freeaddrinfo(res);
    if (fd < 0) throw std::runtime_error("connect " + host + ":" + service + " failed: " + last_err);
    return fd;
}

ProcResult run_process(const std::vector<std::string>& argv, const std::string& cwd, const ProcLimits& lim) {
    OperationArgs args;
    args.argv = argv;
    enforce(events::kSpawn, args);

    ProcResult res;
    if (!proc_run_capture(argv, cwd, lim, &res)) {
        throw std::runtime_error("process start failed: " + res.error);
    }
    return res;
}

} // namespace prism::sdk
