#include "docblocks_discovery.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/function/scalar/string_common.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace duckdb {

// Filename patterns for documentation files; editor backups and hidden files are skipped.
static const char *const DOCUMENTATION_FILE_PATTERNS[] = {"[!.#~]*.md", "[!.#~]*.sql"};

bool MatchFilePattern(const string &pattern, const string &name) {
	return Glob(name.c_str(), name.size(), pattern.c_str(), pattern.size());
}

string ReadFileContents(FileSystem &fs, const string &path) {
	auto handle = fs.OpenFile(path, FileFlags::FILE_FLAGS_READ);
	auto file_size = fs.GetFileSize(*handle);
	string contents(file_size, '\0');
	if (file_size > 0) {
		fs.Read(*handle, &contents[0], file_size);
	}
	return contents;
}

struct FileMatch {
	string absolute_path;
	string relative_path;
};

// Files of a directory come before its subdirectories, each in name order.
static void CollectMatchingFiles(FileSystem &fs, const string &dir, const string &relative_dir, const string &pattern,
                                 vector<FileMatch> &matches) {
	vector<string> files;
	vector<string> directories;
	fs.ListFiles(dir, [&](const string &name, bool is_dir) {
		if (is_dir) {
			directories.push_back(name);
		} else {
			files.push_back(name);
		}
	});
	std::sort(files.begin(), files.end());
	std::sort(directories.begin(), directories.end());

	for (auto &name : files) {
		if (!MatchFilePattern(pattern, name)) {
			continue;
		}
		FileMatch match;
		match.absolute_path = fs.JoinPath(dir, name);
		match.relative_path = relative_dir.empty() ? name : relative_dir + "/" + name;
		matches.push_back(std::move(match));
	}
	for (auto &name : directories) {
		CollectMatchingFiles(fs, fs.JoinPath(dir, name), relative_dir.empty() ? name : relative_dir + "/" + name,
		                     pattern, matches);
	}
}

vector<RawDocument> LoadDocumentationFiles(FileSystem &fs, const string &package_name, const string &root_dir,
                                           const vector<string> &relative_dirs) {
	if (!fs.DirectoryExists(root_dir)) {
		throw IOException("Project root does not exist: " + root_dir);
	}

	vector<RawDocument> documents;
	for (auto &pattern : DOCUMENTATION_FILE_PATTERNS) {
		for (auto &relative_dir : relative_dirs) {
			auto search_dir =
			    relative_dir.empty() || relative_dir == "." ? root_dir : fs.JoinPath(root_dir, relative_dir);
			if (!fs.DirectoryExists(search_dir)) {
				spdlog::debug("docblocks: skipping missing documentation path {}", search_dir);
				continue;
			}

			vector<FileMatch> matches;
			CollectMatchingFiles(fs, search_dir, string(), pattern, matches);
			for (auto &match : matches) {
				RawDocument document;
				document.absolute_path = match.absolute_path;
				document.searched_path = relative_dir;
				document.relative_path = match.relative_path;
				document.package_name = package_name;
				document.root_path = root_dir;
				document.file_contents = ReadFileContents(fs, match.absolute_path);
				documents.push_back(std::move(document));
			}
		}
	}

	spdlog::debug("docblocks: found {} documentation file(s) for package {}", documents.size(), package_name);
	return documents;
}

} // namespace duckdb
