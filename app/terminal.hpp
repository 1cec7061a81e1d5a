#ifndef TERMRAST_APP_TERMINAL_HPP
#define TERMRAST_APP_TERMINAL_HPP

#include <functional>
#include <string>
#include <vector>

namespace termrast::app {

// Fallback grid when the terminal size cannot be queried
constexpr int DEFAULT_WIDTH = 120;
constexpr int DEFAULT_HEIGHT = 30;

constexpr int KEY_ESCAPE = 27;
// Arrow, function and Alt keys; reported once per sequence
constexpr int KEY_SEQUENCE = 0x100;

// Non-blocking keyboard input
bool keyboard_hit();
int get_char();

// Folds a byte starting with ESC into one key. `next_pending` returns the
// next byte already waiting, or -1 when none is. A lone ESC stays
// KEY_ESCAPE; a CSI or SS3 sequence is consumed up to its final byte.
int decode_key(int first, const std::function<int()>& next_pending);

// Reads one key through decode_key; -1 on EOF
int read_key();

// Terminal window size in characters (columns, rows)
void get_terminal_size(int& width, int& height);

// ============================================================================
// Terminal output - raw mode, cursor and frame presentation
// ============================================================================

class Terminal {
public:
    // Enables UTF-8 / VT processing where needed, switches input to
    // unbuffered no-echo, clears the screen and hides the cursor
    Terminal();
    // Restores the input mode, cursor and colors
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    void set_title(const std::string& title);
    void clear_screen();

    // Writes frame lines starting at the top-left corner
    void present(const std::vector<std::string>& lines);

    // Writes text starting at a 1-based row, clearing each line first
    void write_status(int row, const std::vector<std::string>& lines);
};

}  // namespace termrast::app

#endif  // TERMRAST_APP_TERMINAL_HPP
