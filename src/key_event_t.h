#ifndef KEY_EVENT_T
#define KEY_EVENT_T

#include <variant>

struct CharKey {
	char c = {};
};
struct Backspace {};
struct MoveUp {};
struct MoveDown {};
struct Confirm {};
struct Refresh {};
struct Cancel {};

using KeyEvent = std::variant<CharKey, Backspace, MoveUp, MoveDown, Confirm,
                              Refresh, Cancel>;

#endif
