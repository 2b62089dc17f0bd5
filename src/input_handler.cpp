#include "input_handler.h"
#include "timing_t.h"

#include <chrono>
#include <thread>

// ============================================================================
// Input Handler
// ============================================================================

namespace Key {
constexpr int CtrlC     = 0x03;
constexpr int Escape    = 0x1B;
constexpr int Backspace = 0x08;
constexpr int Delete    = 0x7F;
} // namespace Key

[[nodiscard]] bool InputHandler::kbhit() const
{
#ifdef _WIN32
	return _kbhit() != 0;
#else
	fd_set fds = {};
	timeval tv{0, 0};
	FD_ZERO(&fds);
	FD_SET(STDIN_FILENO, &fds);
	return select(STDIN_FILENO + 1, &fds, nullptr, nullptr, &tv) > 0;
#endif
}

[[nodiscard]] int InputHandler::getch() const
{
#ifdef _WIN32
	return _getch();
#else
	unsigned char c = {};
	return (read(STDIN_FILENO, &c, 1) > 0) ? c : -1;
#endif
}

void InputHandler::flush_input() const
{
#ifdef _WIN32
	while (_kbhit()) {
		static_cast<void>(_getch());
	}
#else
	tcflush(STDIN_FILENO, TCIFLUSH);
#endif
}

[[nodiscard]] int InputHandler::read_timeout(const int timeout_ms) const
{
#ifdef _WIN32
	using namespace std::chrono_literals;

	const auto start   = std::chrono::steady_clock::now();
	const auto timeout = std::chrono::milliseconds(timeout_ms);
	while (std::chrono::steady_clock::now() - start < timeout) {
		if (_kbhit()) {
			return _getch();
		}
		std::this_thread::sleep_for(1ms);
	}
	return -1;
#else
	fd_set fds = {};
	FD_ZERO(&fds);
	FD_SET(STDIN_FILENO, &fds);

	timeval tv{0, timeout_ms * 1000};

	if (select(STDIN_FILENO + 1, &fds, nullptr, nullptr, &tv) > 0) {
		unsigned char c = {};
		if (read(STDIN_FILENO, &c, 1) == 1) {
			return c;
		}
	}
	return -1;
#endif
}

// ESC [ A, ESC [ B and ESC O A, ESC O B are the arrows, ESC [ 1 5 ~ is F5.
// A lone ESC cancels.
[[nodiscard]] std::optional<KeyEvent> InputHandler::read_escape_sequence() const
{
	const int timeout = static_cast<int>(Timing::InputTimeout.count());

	const int c1 = read_timeout(timeout);
	if (c1 == -1) {
		return Cancel{};
	}
	if (c1 != '[' && c1 != 'O') {
		flush_input();
		return std::nullopt;
	}

	const int c2 = read_timeout(timeout);
	switch (c2) {
	case 'A': return MoveUp{};
	case 'B': return MoveDown{};
	case '1': {
		const int c3 = read_timeout(timeout);
		const int c4 = read_timeout(timeout);
		if (c3 == '5' && c4 == '~') {
			return Refresh{};
		}
		break;
	}
	default: break;
	}

	flush_input();
	return std::nullopt;
}

InputHandler::InputHandler(const std::optional<char> exit_key) : exit_key_(exit_key)
{
#ifndef _WIN32
	if (tcgetattr(STDIN_FILENO, &old_term_) == 0) {
		termios new_term = old_term_;
		new_term.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO);
		restore_ = tcsetattr(STDIN_FILENO, TCSANOW, &new_term) == 0;
	}
#endif
}

InputHandler::~InputHandler()
{
#ifndef _WIN32
	if (restore_) {
		tcsetattr(STDIN_FILENO, TCSANOW, &old_term_);
	}
#endif
}

[[nodiscard]] std::optional<KeyEvent> InputHandler::poll()
{
	if (!kbhit()) {
		return std::nullopt;
	}

	const int c = getch();

#ifdef _WIN32
	// Special keys arrive as 0 or 0xE0 followed by a scan code
	if (c == 0 || c == 0xE0) {
		switch (getch()) {
		case 72: return MoveUp{};
		case 80: return MoveDown{};
		case 63: return Refresh{};
		default: return std::nullopt;
		}
	}
#endif

	if (c == Key::Escape) {
		return read_escape_sequence();
	}
	return translate(c, exit_key_);
}

[[nodiscard]] std::optional<KeyEvent> InputHandler::translate(
        const int c, const std::optional<char> exit_key)
{
	if (c == Key::CtrlC || c == Key::Escape) {
		return Cancel{};
	}

	// Editing keys win over an exit key sharing their control code
	if (c == Key::Delete || c == Key::Backspace) {
		return Backspace{};
	}

	if (c == '\r' || c == '\n') {
		return Confirm{};
	}

	if (exit_key && c == (*exit_key & 0x1F)) {
		return Cancel{};
	}

	// No umlauts or other multi-byte input; folding is ASCII only
	if (c >= 32 && c <= 126) {
		return CharKey{static_cast<char>(c)};
	}

	return std::nullopt;
}
