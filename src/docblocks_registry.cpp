#include "docblocks_registry.hpp"

#include "docblocks_scanner.hpp"

namespace duckdb {

string RawDocument::OriginalFilePath() const {
	if (searched_path.empty()) {
		return relative_path;
	}
	if (searched_path.back() == '/') {
		return searched_path + relative_path;
	}
	return searched_path + "/" + relative_path;
}

static string DuplicateResourceMessage(const DocRecord &previous, const DocRecord &duplicate) {
	return "Found two documentation blocks with the name \"" + duplicate.name + "\" in package \"" +
	       duplicate.package_name + "\". Documentation names must be unique within a package, rename one of:\n- " +
	       previous.unique_id + " (" + previous.original_file_path + ")\n- " + duplicate.unique_id + " (" +
	       duplicate.original_file_path + ")";
}

DuplicateResourceException::DuplicateResourceException(const DocRecord &previous_p, const DocRecord &duplicate_p)
    : InvalidInputException(DuplicateResourceMessage(previous_p, duplicate_p)), previous(previous_p),
      duplicate(duplicate_p) {
}

string DocUniqueId(const string &package_name, const string &name) {
	// docs live in their own namespace, so the resource type is not part of the id
	return package_name + "." + name;
}

void AddDocumentation(DocRegistry &registry, const RawDocument &document) {
	auto original_file_path = document.OriginalFilePath();
	for (auto &candidate : ScanDocBlocks(document.file_contents)) {
		DocRecord record;
		record.unique_id = DocUniqueId(document.package_name, candidate.name);
		record.name = candidate.name;
		record.resource_type = DOCUMENTATION_RESOURCE_TYPE;
		record.root_path = document.root_path;
		record.path = document.relative_path;
		record.original_file_path = original_file_path;
		record.package_name = document.package_name;
		record.file_contents = document.file_contents;
		record.block_contents = std::move(candidate.block_contents);

		auto entry = registry.find(record.unique_id);
		if (entry != registry.end()) {
			throw DuplicateResourceException(entry->second, record);
		}
		auto key = record.unique_id;
		registry.emplace(std::move(key), std::move(record));
	}
}

DocRegistry BuildDocRegistry(const vector<RawDocument> &documents) {
	DocRegistry registry;
	for (auto &document : documents) {
		AddDocumentation(registry, document);
	}
	return registry;
}

} // namespace duckdb
