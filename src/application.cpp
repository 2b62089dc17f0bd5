#include "application.h"
#include "input_handler.h"
#include "launcher.h"
#include "timing_t.h"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

// ============================================================================
// Application
// ============================================================================

void Application::event_worker(const std::stop_token stoken)
{
	using namespace std::string_view_literals;

	while (!stoken.stop_requested() && running_) {
		try {
			display_.tick(std::chrono::steady_clock::now());

			const auto event = queue_.pop(Timing::EventWait);
			if (!event) {
				continue;
			}
			dispatch(*event);
		} catch (const std::logic_error& e) {
			std::cerr << "Internal error: "sv << e.what() << '\n';
			exit_code_ = ExitError;
			running_   = false;
		} catch (const std::exception& e) {
			std::cerr << "Event error: "sv << e.what() << '\n';
		}
	}
}

void Application::dispatch(const KeyEvent& event)
{
	const bool overlay = shows_filter(event, session_->history());

	session_->handle(event);

	if (overlay && session_->state() == SessionState::Active) {
		display_.show_filter(session_->query(), std::chrono::steady_clock::now());
	}
}

[[nodiscard]] bool Application::shows_filter(const KeyEvent& event,
                                             const QueryHistory& history)
{
	if (std::holds_alternative<CharKey>(event)) {
		return true;
	}
	// Backspace with nothing to undo leaves the query as it is
	return std::holds_alternative<Backspace>(event) && !history.empty();
}

void Application::execute(const std::string& command)
{
	if (Launcher::spawn(command)) {
		launched_ = command;
	} else {
		exit_code_ = ExitError;
	}
}

Application::Application(Config config)
        : config_(std::move(config)),
          source_(config_),
          display_("quicklaunch: " + config_.name, config_.rows,
                   config_.normal, config_.focus)
{}

[[nodiscard]] int Application::run()
{
	using namespace std::string_view_literals;

	try {
		auto items = source_.load();
		if (!items) {
			std::cerr << "Error: no catalog could be built\n"sv;
			return ExitError;
		}

		{
			InputHandler input(config_.exit_key);
			source_.set_verbose(false);
			display_.draw_frame();

			session_ = std::make_unique<Session>(
			        std::move(*items), source_, display_,
			        [this](const std::string& command) { execute(command); },
			        config_.rows);
			session_->start([this] { running_ = false; });

			std::jthread worker([this](const std::stop_token st) {
				event_worker(st);
			});

			while (running_) {
				try {
					if (auto event = input.poll()) {
						queue_.emplace(std::move(*event));
					}
					std::this_thread::sleep_for(Timing::IOSleep);
				} catch (const std::exception& e) {
					std::cerr << "Input error: "sv << e.what() << '\n';
				}
			}

			queue_.close();
			worker.request_stop();
			worker.join();
			display_.close();
		}

		if (launched_) {
			std::cout << "Launching "sv << *launched_ << '\n';
		}
		return exit_code_;
	} catch (const std::exception& e) {
		std::cerr << "Fatal error: "sv << e.what() << '\n';
		return ExitError;
	}
}
