#include "terminal.hpp"

#include <iostream>

#ifdef _WIN32
#define NOMINMAX  // Prevent windows.h from defining min/max macros
#include <conio.h>
#include <windows.h>
#else
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#endif

namespace termrast::app {

// ============================================================================
// Platform-specific keyboard input
// ============================================================================

#ifdef _WIN32
// Windows: use _kbhit() and _getch() from conio.h
bool keyboard_hit() { return _kbhit() != 0; }
int get_char() { return _getch(); }

void get_terminal_size(int& width, int& height) {
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (GetConsoleScreenBufferInfo(hOut, &csbi)) {
        width = csbi.srWindow.Right - csbi.srWindow.Left + 1;
        height = csbi.srWindow.Bottom - csbi.srWindow.Top + 1;
    } else {
        width = DEFAULT_WIDTH;
        height = DEFAULT_HEIGHT;
    }
}
#else
// POSIX: the Terminal keeps stdin in noncanonical mode, so a zero-timeout
// poll tells whether a byte is waiting
bool keyboard_hit() {
    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    pfd.revents = 0;
    return poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN) != 0;
}

// Unbuffered so poll() and reads agree; -1 on EOF or error
int get_char() {
    unsigned char ch;
    ssize_t n = read(STDIN_FILENO, &ch, 1);
    return n == 1 ? ch : -1;
}

void get_terminal_size(int& width, int& height) {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        width = ws.ws_col;
        height = ws.ws_row;
    } else {
        width = DEFAULT_WIDTH;
        height = DEFAULT_HEIGHT;
    }
}

namespace {
struct termios saved_termios;
bool termios_saved = false;
}  // namespace
#endif

int decode_key(int first, const std::function<int()>& next_pending) {
    if (first != KEY_ESCAPE) return first;

    int introducer = next_pending();
    if (introducer < 0) return KEY_ESCAPE;
    if (introducer == '[') {
        // Parameter and intermediate bytes run until a final byte in @..~
        for (int ch = next_pending(); ch >= 0; ch = next_pending()) {
            if (ch >= 0x40 && ch <= 0x7E) break;
        }
    } else if (introducer == 'O') {
        next_pending();
    }
    return KEY_SEQUENCE;
}

int read_key() {
    int ch = get_char();
    if (ch < 0) return -1;
#ifdef _WIN32
    // Extended keys arrive as a 0 or 0xE0 prefix plus a scan code
    if (ch == 0 || ch == 0xE0) {
        get_char();
        return KEY_SEQUENCE;
    }
#endif
    return decode_key(ch, [] { return keyboard_hit() ? get_char() : -1; });
}

Terminal::Terminal() {
#ifdef _WIN32
    // Set console to UTF-8 code page
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCP(CP_UTF8);

    // Enable virtual terminal processing for ANSI escape sequences
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    DWORD dwMode = 0;
    GetConsoleMode(hOut, &dwMode);
    dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    SetConsoleMode(hOut, dwMode);
#else
    if (tcgetattr(STDIN_FILENO, &saved_termios) == 0) {
        termios_saved = true;
        struct termios raw = saved_termios;
        raw.c_lflag &= ~(ICANON | ECHO);
        tcsetattr(STDIN_FILENO, TCSANOW, &raw);
    }
#endif
    std::cout << "\033[2J";     // Clear screen
    std::cout << "\033[?25l";   // Hide cursor
    std::cout << std::flush;
}

Terminal::~Terminal() {
    std::cout << "\033[0m";     // Reset colors
    std::cout << "\033[?25h";   // Show cursor
    std::cout << "\033]2;\007"; // Clear title
    std::cout << "\n" << std::flush;
#ifndef _WIN32
    if (termios_saved) {
        tcsetattr(STDIN_FILENO, TCSADRAIN, &saved_termios);
    }
#endif
}

void Terminal::set_title(const std::string& title) {
    std::cout << "\033]2;" << title << "\007" << std::flush;
}

void Terminal::clear_screen() {
    std::cout << "\033[2J\033[H" << std::flush;
}

void Terminal::present(const std::vector<std::string>& lines) {
    std::string output;
    size_t total = 8;
    for (const auto& line : lines) total += line.size() + 1;
    output.reserve(total);

    // Move cursor to top-left
    output += "\033[H";
    for (size_t i = 0; i < lines.size(); i++) {
        output += lines[i];
        if (i + 1 < lines.size()) output += '\n';
    }
    std::cout << output << std::flush;
}

void Terminal::write_status(int row, const std::vector<std::string>& lines) {
    for (size_t i = 0; i < lines.size(); i++) {
        std::cout << "\033[" << (row + static_cast<int>(i)) << ";1H\033[K" << lines[i];
    }
    std::cout << std::flush;
}

}  // namespace termrast::app
