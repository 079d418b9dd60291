#pragma once

#include "docblocks_registry.hpp"
#include "duckdb/common/file_system.hpp"

namespace duckdb {

// Glob match of a file name: `*`, `?`, `[abc]` and `[!abc]`.
bool MatchFilePattern(const string &pattern, const string &name);

// Walk root_dir/relative_dir for every pattern and directory and read each match.
// Throws IOException when root_dir does not exist; missing relative dirs are skipped.
vector<RawDocument> LoadDocumentationFiles(FileSystem &fs, const string &package_name, const string &root_dir,
                                           const vector<string> &relative_dirs);

// Read a whole file without any newline handling.
string ReadFileContents(FileSystem &fs, const string &path);

} // namespace duckdb
