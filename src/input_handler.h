#ifndef INPUT_HANDLER_H
#define INPUT_HANDLER_H

#include "key_event_t.h"

#include <optional>

#ifdef _WIN32
#define NOMINMAX
#include <conio.h>
#include <windows.h>
#else
#include <sys/select.h>
#include <termios.h>
#include <unistd.h>
#endif

// ============================================================================
// Input Handler
// ============================================================================

// Puts the terminal into raw mode for its lifetime and turns key presses
// into KeyEvents.
class InputHandler {
#ifndef _WIN32
	termios old_term_ = {};
	bool restore_     = false;
#endif
	std::optional<char> exit_key_ = {};

	[[nodiscard]] bool kbhit() const;

	[[nodiscard]] int getch() const;

	void flush_input() const;

	[[nodiscard]] int read_timeout(const int timeout_ms) const;

	[[nodiscard]] std::optional<KeyEvent> read_escape_sequence() const;

public:
	explicit InputHandler(const std::optional<char> exit_key = std::nullopt);

	~InputHandler();

	InputHandler(const InputHandler&)            = delete;
	InputHandler& operator=(const InputHandler&) = delete;

	[[nodiscard]] std::optional<KeyEvent> poll();

	// Maps one already-read byte; escape sequences need the live terminal.
	[[nodiscard]] static std::optional<KeyEvent> translate(
	        const int c, const std::optional<char> exit_key);
};

#endif
