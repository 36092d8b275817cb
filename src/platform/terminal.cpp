#include "terminal.hpp"

#include <termios.h>
#include <unistd.h>
#include <iostream>

namespace platform {

// ── NoEchoGuard ──────────────────────────────────────────────

struct NoEchoGuard::Impl {
    struct termios old_term;
    bool saved = false;
};

NoEchoGuard::NoEchoGuard() : impl_(new Impl) {
    if (tcgetattr(STDIN_FILENO, &impl_->old_term) != 0) return;
    impl_->saved = true;
    struct termios quiet = impl_->old_term;
    quiet.c_lflag &= ~ECHO;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &quiet);
}

NoEchoGuard::~NoEchoGuard() {
    if (impl_) {
        if (impl_->saved) {
            tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        }
        delete impl_;
    }
}

// ── Secret input ─────────────────────────────────────────────

bool stdin_is_tty() {
    return isatty(STDIN_FILENO) == 1;
}

std::string read_secret(const std::string& prompt) {
    if (!stdin_is_tty()) return "";

    std::cout << prompt << std::flush;
    std::string line;
    {
        NoEchoGuard guard;
        std::getline(std::cin, line);
    }
    std::cout << "\n";
    return line;
}

} // namespace platform
