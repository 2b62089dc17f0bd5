#ifndef CATALOG_LOADER_H
#define CATALOG_LOADER_H

#include "catalog_source.h"
#include "config_t.h"
#include "item_t.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Catalog Loader
// ============================================================================

struct DesktopEntry {
	std::string name                = {};
	std::string exec                = {};
	std::optional<std::string> icon = {};
	bool terminal                   = false;
	bool show                       = false;
};

namespace Icons {
constexpr auto Application = "applications-other";
constexpr auto Executable  = "applications-all";
constexpr auto Document    = "gnome-documents";
} // namespace Icons

// Builds the item list from desktop files, executable directories and
// document trees, and keeps the persisted catalog cache in step.
class FileCatalogSource : public CatalogSource {
	using FileCallback = std::function<void(const std::filesystem::path& path,
	                                        const std::string& file_name)>;

	Config config_ = {};
	bool verbose_  = true;

	static void read_files(const std::vector<std::string>& dirs,
	                       const std::vector<std::string>& extensions,
	                       const bool recursive, const FileCallback& callback);

	void read_desktop_apps(std::vector<Item>& items) const;

	void read_documents(std::vector<Item>& items) const;

	void read_bin_files(std::vector<Item>& items) const;

public:
	explicit FileCatalogSource(Config config);

	// Informational output on std::cout; errors are always reported.
	void set_verbose(const bool verbose);

	[[nodiscard]] std::optional<std::vector<Item>> load() override;

	[[nodiscard]] std::optional<std::vector<Item>> rescan() override;

	[[nodiscard]] static std::optional<DesktopEntry> parse_desktop_file(
	        const std::filesystem::path& file);

	[[nodiscard]] static std::string strip_field_codes(const std::string_view exec);
};

#endif
