#include "catalog_loader.h"
#include "catalog_cache.h"
#include "utilities.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <map>
#include <set>
#include <unordered_set>

// ============================================================================
// Catalog Loader
// ============================================================================

namespace fs = std::filesystem;

void FileCatalogSource::read_files(const std::vector<std::string>& dirs,
                                   const std::vector<std::string>& extensions,
                                   const bool recursive,
                                   const FileCallback& callback)
{
	using namespace std::string_view_literals;

	const std::set<std::string, std::less<>> accepted(extensions.begin(),
	                                                  extensions.end());

	// "-/some/dir" excludes that subtree from the walk
	std::vector<fs::path> roots = {};
	std::set<fs::path> excluded = {};
	for (const auto& dir : dirs) {
		if (dir.starts_with('-')) {
			excluded.insert(fs::path(dir.substr(1)).lexically_normal());
		} else {
			roots.emplace_back(dir);
		}
	}

	const auto visit_file = [&](const fs::directory_entry& entry) {
		std::error_code ec = {};
		if (!entry.is_regular_file(ec)) {
			return;
		}
		const auto file_name = entry.path().filename().string();
		if (!accepted.empty() && !accepted.contains(Util::extension_of(file_name))) {
			return;
		}
		callback(entry.path(), file_name);
	};

	for (const auto& root : roots) {
		if (excluded.contains(root.lexically_normal())) {
			continue;
		}

		std::error_code ec = {};
		if (!recursive) {
			for (fs::directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
			     !ec && it != fs::directory_iterator(); it.increment(ec)) {
				visit_file(*it);
			}
		} else {
			for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
			     !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
				std::error_code type_ec = {};
				if (it->is_directory(type_ec)) {
					if (excluded.contains(it->path().lexically_normal())) {
						it.disable_recursion_pending();
					}
					continue;
				}
				visit_file(*it);
			}
		}

		if (ec) {
			std::cerr << "Skipping "sv << root.string() << ": "sv << ec.message()
			          << '\n';
		}
	}
}

void FileCatalogSource::read_desktop_apps(std::vector<Item>& items) const
{
	// Later directories override earlier ones, so an entry is only final
	// once every directory has been read. A hidden entry removes the name.
	std::map<std::string, std::optional<DesktopEntry>> apps = {};

	for (const auto& dir : config_.app_dirs) {
		std::vector<fs::path> files = {};
		read_files({dir.string()}, {"desktop"}, true,
		           [&files](const fs::path& path, const std::string&) {
			           files.push_back(path);
		           });
		std::ranges::sort(files);

		for (const auto& file : files) {
			auto entry = parse_desktop_file(file);
			if (!entry || entry->name.empty()) {
				continue;
			}
			auto& slot = apps[entry->name];
			if (entry->show) {
				slot = std::move(*entry);
			} else {
				slot.reset();
			}
		}
	}

	for (auto& [name, entry] : apps) {
		if (!entry) {
			continue;
		}
		std::string command = entry->terminal
		                              ? config_.terminal + " -e " + entry->exec
		                              : entry->exec;
		items.emplace_back(make_item(ItemKind::Application, name, std::move(command),
		                             entry->icon.value_or(Icons::Application)));
	}
}

void FileCatalogSource::read_documents(std::vector<Item>& items) const
{
	read_files(config_.doc_dirs, config_.doc_ext, true,
	           [&items](const fs::path& path, const std::string& file_name) {
		           items.emplace_back(make_item(ItemKind::Document, file_name,
		                                        "xdg-open \"" + path.string() + "\"",
		                                        Icons::Document));
	           });
}

void FileCatalogSource::read_bin_files(std::vector<Item>& items) const
{
	// /bin and /usr/bin often hold the same programs
	std::unordered_set<std::string> seen = {};

	read_files(config_.bin_dirs, config_.bin_ext, false,
	           [&](const fs::path& path, const std::string& file_name) {
		           if (file_name.size() == 1 || !seen.insert(file_name).second) {
			           return;
		           }
		           items.emplace_back(make_item(ItemKind::Executable, file_name,
		                                        config_.terminal + " -e " + path.string(),
		                                        Icons::Executable));
	           });
}

FileCatalogSource::FileCatalogSource(Config config) : config_(std::move(config))
{
	apply_path_defaults(config_);
}

void FileCatalogSource::set_verbose(const bool verbose)
{
	verbose_ = verbose;
}

[[nodiscard]] std::optional<std::vector<Item>> FileCatalogSource::load()
{
	if (!config_.disable_cache) {
		if (auto cached = CatalogCache::read(config_.cache_file)) {
			if (verbose_) {
				std::cout << "Read " << cached->size() << " catalog items from "
				          << config_.cache_file.string() << ".\n";
			}
			return cached;
		}
	}
	return rescan();
}

[[nodiscard]] std::optional<std::vector<Item>> FileCatalogSource::rescan()
{
	std::vector<Item> items = {};

	try {
		if (!config_.disable_apps) {
			read_desktop_apps(items);
		}
		if (!config_.doc_dirs.empty()) {
			read_documents(items);
		}
		if (!config_.bin_dirs.empty()) {
			read_bin_files(items);
		}
	} catch (const std::exception& e) {
		std::cerr << "Catalog scan error: " << e.what() << '\n';
		return std::nullopt;
	}

	if (verbose_) {
		std::cout << "Loaded " << items.size() << " catalog items.\n";
	}

	if (!config_.disable_cache && !CatalogCache::write(config_.cache_file, items)) {
		std::cerr << "Catalog cache not updated\n";
	}
	return items;
}

[[nodiscard]] std::optional<DesktopEntry> FileCatalogSource::parse_desktop_file(
        const fs::path& file)
{
	std::ifstream in(file);
	if (!in) {
		return std::nullopt;
	}

	std::map<std::string, std::string, std::less<>> keys = {};
	bool in_main_group = false;

	for (std::string line = {}; std::getline(in, line);) {
		const auto trimmed = Util::trim(line);
		if (trimmed.empty() || trimmed.starts_with('#')) {
			continue;
		}
		if (trimmed.starts_with('[')) {
			in_main_group = (trimmed == "[Desktop Entry]");
			continue;
		}
		if (!in_main_group) {
			continue;
		}

		const size_t eq = trimmed.find('=');
		if (eq == std::string::npos) {
			continue;
		}
		auto key = Util::trim(std::string_view(trimmed).substr(0, eq));
		// Localized keys such as Name[de] are ignored
		if (key.find('[') != std::string::npos) {
			continue;
		}
		keys.insert_or_assign(std::move(key),
		                      Util::trim(std::string_view(trimmed).substr(eq + 1)));
	}

	const auto value = [&keys](const std::string_view key) -> std::string {
		const auto it = keys.find(key);
		return it != keys.end() ? it->second : std::string();
	};
	const auto flag = [&value](const std::string_view key) {
		return Util::to_lower(value(key)) == "true";
	};

	DesktopEntry entry = {.name     = value("Name"),
	                      .exec     = strip_field_codes(value("Exec")),
	                      .terminal = flag("Terminal")};

	if (auto icon = value("Icon"); !icon.empty()) {
		entry.icon = std::move(icon);
	}

	entry.show = value("Type") == "Application" && !flag("NoDisplay") &&
	             !flag("Hidden") && !entry.name.empty() && !entry.exec.empty();
	return entry;
}

[[nodiscard]] std::string FileCatalogSource::strip_field_codes(const std::string_view exec)
{
	std::string result = {};
	result.reserve(exec.size());

	for (size_t i = 0; i < exec.size(); ++i) {
		if (exec[i] != '%' || i + 1 == exec.size()) {
			result += exec[i];
			continue;
		}
		const char code = exec[++i];
		if (code == '%') {
			result += '%';
		}
	}

	// Dropped codes leave doubled or trailing blanks behind
	std::string collapsed = {};
	for (const char c : Util::trim(result)) {
		if (c == ' ' && !collapsed.empty() && collapsed.back() == ' ') {
			continue;
		}
		collapsed += c;
	}
	return collapsed;
}
