#ifndef APPLICATION_H
#define APPLICATION_H

#include "catalog_loader.h"
#include "config_t.h"
#include "display_manager.h"
#include "event_queue.h"
#include "exit_codes_t.h"
#include "key_event_t.h"
#include "session.h"

#include <atomic>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

// ============================================================================
// Application
// ============================================================================

class Application {
	Config config_;
	FileCatalogSource source_;
	DisplayManager display_;
	EventQueue<KeyEvent> queue_       = {};
	std::unique_ptr<Session> session_ = {};

	std::atomic<bool> running_{true};
	std::atomic<int> exit_code_{ExitSuccess};
	std::optional<std::string> launched_ = {};

	void event_worker(const std::stop_token stoken);

	void dispatch(const KeyEvent& event);

	void execute(const std::string& command);

public:
	explicit Application(Config config);

	[[nodiscard]] int run();

	// Whether the filter overlay is shown for a key, judged before the key
	// is handled.
	[[nodiscard]] static bool shows_filter(const KeyEvent& event,
	                                       const QueryHistory& history);
};

#endif
