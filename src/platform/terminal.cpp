#include "terminal.hpp"
#include <iostream>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <windows.h>
#  include <io.h>
#else
#  include <termios.h>
#  include <unistd.h>
#endif

namespace platform {

#ifdef _WIN32

NoEchoGuard::NoEchoGuard() {
    HANDLE h = GetStdHandle(STD_INPUT_HANDLE);
    GetConsoleMode(h, &old_mode_);
    SetConsoleMode(h, old_mode_ & ~ENABLE_ECHO_INPUT);
}

NoEchoGuard::~NoEchoGuard() {
    SetConsoleMode(GetStdHandle(STD_INPUT_HANDLE), old_mode_);
}

bool stdout_is_tty() {
    return _isatty(_fileno(stdout)) != 0;
}

#else // Unix

struct NoEchoGuard::Impl {
    struct termios old_term;
    bool saved = false;
};

NoEchoGuard::NoEchoGuard() : impl_(new Impl) {
    if (tcgetattr(STDIN_FILENO, &impl_->old_term) != 0) return;
    impl_->saved = true;
    struct termios quiet = impl_->old_term;
    quiet.c_lflag &= ~ECHO;
    tcsetattr(STDIN_FILENO, TCSANOW, &quiet);
}

NoEchoGuard::~NoEchoGuard() {
    if (impl_->saved) {
        tcsetattr(STDIN_FILENO, TCSANOW, &impl_->old_term);
    }
    delete impl_;
}

bool stdout_is_tty() {
    return isatty(STDOUT_FILENO) != 0;
}

#endif

std::string read_password(const std::string& prompt) {
    std::cerr << prompt << std::flush;
    std::string line;
    {
        NoEchoGuard guard;
        std::getline(std::cin, line);
    }
    std::cerr << "\n";
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

} // namespace platform
