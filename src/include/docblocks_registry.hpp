#pragma once

#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/map.hpp"

namespace duckdb {

static constexpr const char *DOCUMENTATION_RESOURCE_TYPE = "documentation";

// A documentation file as handed over by discovery. Never modified.
struct RawDocument {
	string absolute_path;
	string searched_path; // documentation dir the file was found under, relative to root_path
	string relative_path; // relative to root_path/searched_path
	string package_name;
	string root_path;
	string file_contents;

	// searched_path/relative_path
	string OriginalFilePath() const;
};

struct DocRecord {
	string unique_id;
	string name;
	string resource_type;
	string root_path;
	string path;
	string original_file_path;
	string package_name;
	string file_contents;
	string block_contents;
};

// unique_id -> record, for a single package
using DocRegistry = map<string, DocRecord>;

class DuplicateResourceException : public InvalidInputException {
public:
	DuplicateResourceException(const DocRecord &previous, const DocRecord &duplicate);

	DocRecord previous;
	DocRecord duplicate;
};

string DocUniqueId(const string &package_name, const string &name);

// Scan `document` and add its documentation blocks to `registry`.
// Throws DuplicateResourceException on the first id already present; the stored record is kept.
void AddDocumentation(DocRegistry &registry, const RawDocument &document);

DocRegistry BuildDocRegistry(const vector<RawDocument> &documents);

} // namespace duckdb
