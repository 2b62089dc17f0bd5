#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include "catalog_source.h"
#include "item_t.h"
#include "renderer.h"

#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Test Helpers
// ============================================================================

// Remembers every call so tests can count redraws.
class RecordingRenderer : public Renderer {
public:
	struct Highlight {
		size_t row   = {};
		bool focused = {};
	};

	size_t full_redraws                = 0;
	std::vector<Highlight> highlights  = {};
	std::vector<std::string> last_rows = {};
	size_t focused_row                 = 0;

	void draw_rows(const std::vector<const Item*>& rows) override;

	void highlight_row(const size_t row, const bool focused) override;

	void clear_log();
};

class StubSource : public CatalogSource {
public:
	std::optional<std::vector<Item>> next = {};
	bool throw_on_rescan                  = false;
	size_t rescans                        = 0;

	[[nodiscard]] std::optional<std::vector<Item>> load() override;

	[[nodiscard]] std::optional<std::vector<Item>> rescan() override;
};

// Directory under the system temp path, removed with everything in it.
class TempDir {
	std::filesystem::path path_ = {};

public:
	TempDir();
	~TempDir();

	TempDir(const TempDir&)            = delete;
	TempDir& operator=(const TempDir&) = delete;

	[[nodiscard]] const std::filesystem::path& path() const;

	std::filesystem::path write(const std::string_view relative,
	                            const std::string_view content = {}) const;

	std::filesystem::path mkdir(const std::string_view relative) const;
};

[[nodiscard]] std::vector<Item> make_items(
        std::initializer_list<std::pair<ItemKind, std::string>> entries);

[[nodiscard]] std::vector<std::string> names_of(const std::vector<Item>& items);

#endif
