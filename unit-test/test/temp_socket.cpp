#include "test/temp_socket.hpp"
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace sandbox::test {
using namespace std;

temp_socket::temp_socket(const filesystem::path &path) : path(path) {
    filesystem::remove(path);

    fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) throw system_error(errno, generic_category(), "socket");

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    if (::bind(fd, (struct sockaddr *)&addr, sizeof(addr)) < 0 || listen(fd, 1) < 0) {
        int err = errno;
        close(fd);
        throw system_error(err, generic_category(), "bind " + path.string());
    }
}

temp_socket::~temp_socket() {
    close(fd);
    error_code ec;
    filesystem::remove(path, ec);
}

}  // namespace sandbox::test
