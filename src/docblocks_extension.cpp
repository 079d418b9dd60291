#define DUCKDB_EXTENSION_MAIN

#include "docblocks_extension.hpp"
#include "docblocks_discovery.hpp"
#include "docblocks_frontmatter.hpp"
#include "docblocks_registry.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/file_system.hpp"
#include "duckdb/common/types/vector.hpp"
#include "duckdb/common/vector_operations/binary_executor.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/main/config.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include "duckdb/main/extension_helper.hpp"

#include <algorithm>
#include <functional>

namespace duckdb {

static constexpr const char *WARN_ERROR_SETTING = "docblocks_warn_error";
static constexpr const char *FRONTMATTER_ON_ERROR_SETTING = "docblocks_frontmatter_on_error";

static bool WarnErrorEnabled(ClientContext &context) {
	Value value;
	if (context.TryGetCurrentSetting(WARN_ERROR_SETTING, value) && !value.IsNull()) {
		return BooleanValue::Get(value);
	}
	return false;
}

static FrontmatterErrorPolicy DefaultFrontmatterPolicy(ClientContext &context) {
	Value value;
	if (context.TryGetCurrentSetting(FRONTMATTER_ON_ERROR_SETTING, value) && !value.IsNull()) {
		return FrontmatterErrorPolicyFromString(value.ToString());
	}
	return FrontmatterErrorPolicy::WARN_OR_ERROR;
}

//===--------------------------------------------------------------------===//
// read_docs table function
//===--------------------------------------------------------------------===//

struct ReadDocsBindData : public TableFunctionData {
	string root_dir;
	string package_name;
	vector<string> paths;
	vector<DocRecord> records;
};

struct ReadDocsScanState : public GlobalTableFunctionState {
	idx_t position = 0;
};

// Last path component of the project root, e.g. "/work/jaffle_shop/" -> "jaffle_shop"
static string DefaultPackageName(string root_dir) {
	std::replace(root_dir.begin(), root_dir.end(), '\\', '/');
	while (root_dir.size() > 1 && root_dir.back() == '/') {
		root_dir.pop_back();
	}
	auto sep = root_dir.find_last_of('/');
	return sep == string::npos ? root_dir : root_dir.substr(sep + 1);
}

static unique_ptr<FunctionData> ReadDocsBind(ClientContext &context, TableFunctionBindInput &input,
                                             vector<LogicalType> &return_types, vector<string> &names) {
	if (input.inputs.empty() || input.inputs[0].IsNull()) {
		throw BinderException("read_docs requires a project root argument");
	}

	auto result = make_uniq<ReadDocsBindData>();
	result->root_dir = input.inputs[0].GetValue<string>();
	result->paths = {"models"};

	auto it = input.named_parameters.find("package_name");
	if (it != input.named_parameters.end() && !it->second.IsNull()) {
		result->package_name = it->second.GetValue<string>();
	}
	it = input.named_parameters.find("paths");
	if (it != input.named_parameters.end() && !it->second.IsNull()) {
		result->paths.clear();
		for (auto &path : ListValue::GetChildren(it->second)) {
			if (path.IsNull()) {
				throw BinderException("read_docs paths must not contain NULL");
			}
			result->paths.push_back(path.GetValue<string>());
		}
	}
	if (result->package_name.empty()) {
		result->package_name = DefaultPackageName(result->root_dir);
	}
	if (result->package_name.empty()) {
		throw BinderException("read_docs could not derive a package name from \"%s\", pass package_name",
		                      result->root_dir);
	}

	// Build the whole registry up front so a duplicate fails the query before any row is produced.
	auto &fs = FileSystem::GetFileSystem(context);
	auto documents = LoadDocumentationFiles(fs, result->package_name, result->root_dir, result->paths);
	auto registry = BuildDocRegistry(documents);
	result->records.reserve(registry.size());
	for (auto &entry : registry) {
		result->records.push_back(std::move(entry.second));
	}

	for (auto &column : {"unique_id", "name", "resource_type", "package_name", "root_path", "path",
	                     "original_file_path", "block_contents", "file_contents"}) {
		return_types.emplace_back(LogicalType::VARCHAR);
		names.emplace_back(column);
	}
	return std::move(result);
}

static unique_ptr<GlobalTableFunctionState> ReadDocsInitGlobal(ClientContext &context, TableFunctionInitInput &input) {
	return make_uniq<ReadDocsScanState>();
}

static void ReadDocsFunction(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &bind_data = data_p.bind_data->Cast<ReadDocsBindData>();
	auto &gstate = data_p.global_state->Cast<ReadDocsScanState>();

	idx_t batch_end = std::min(gstate.position + STANDARD_VECTOR_SIZE, (idx_t)bind_data.records.size());
	idx_t count = 0;
	for (idx_t i = gstate.position; i < batch_end; i++) {
		auto &record = bind_data.records[i];
		const string *fields[] = {&record.unique_id,          &record.name,           &record.resource_type,
		                          &record.package_name,       &record.root_path,      &record.path,
		                          &record.original_file_path, &record.block_contents, &record.file_contents};
		for (idx_t col = 0; col < output.ColumnCount(); col++) {
			auto data = FlatVector::GetData<string_t>(output.data[col]);
			data[count] = StringVector::AddString(output.data[col], *fields[col]);
		}
		count++;
	}
	gstate.position = batch_end;
	output.SetCardinality(count);
}

static unique_ptr<NodeStatistics> ReadDocsCardinality(ClientContext &context, const FunctionData *bind_data) {
	auto &data = bind_data->Cast<ReadDocsBindData>();
	idx_t n = data.records.size();
	return make_uniq<NodeStatistics>(n, n);
}

//===--------------------------------------------------------------------===//
// Frontmatter and YAML scalar functions
//===--------------------------------------------------------------------===//

using frontmatter_emit_t = std::function<string_t(FrontmatterResult &fm, ValidityMask &mask, idx_t idx)>;

// Runs ParseFrontmatter over the content column; the optional second column is the error policy.
static void ExecuteFrontmatter(DataChunk &args, ExpressionState &state, Vector &result,
                               const frontmatter_emit_t &emit) {
	auto &context = state.GetContext();
	LoggingWarningChannel warnings(WarnErrorEnabled(context));
	if (args.ColumnCount() == 1) {
		auto policy = DefaultFrontmatterPolicy(context);
		UnaryExecutor::ExecuteWithNulls<string_t, string_t>(
		    args.data[0], result, args.size(), [&](string_t content, ValidityMask &mask, idx_t idx) {
			    auto fm = ParseFrontmatter(content.GetString(), policy, warnings);
			    return emit(fm, mask, idx);
		    });
		return;
	}
	BinaryExecutor::ExecuteWithNulls<string_t, string_t, string_t>(
	    args.data[0], args.data[1], result, args.size(),
	    [&](string_t content, string_t on_error, ValidityMask &mask, idx_t idx) {
		    auto fm = ParseFrontmatter(content.GetString(), FrontmatterErrorPolicyFromString(on_error.GetString()),
		                               warnings);
		    return emit(fm, mask, idx);
	    });
}

static void FrontmatterPropertiesFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	ExecuteFrontmatter(args, state, result, [&](FrontmatterResult &fm, ValidityMask &mask, idx_t idx) {
		if (!fm.properties) {
			mask.SetInvalid(idx);
			return string_t();
		}
		return StringVector::AddString(result, fm.properties->ToJson());
	});
}

static void FrontmatterBodyFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	ExecuteFrontmatter(args, state, result, [&](FrontmatterResult &fm, ValidityMask &mask, idx_t idx) {
		return StringVector::AddString(result, fm.body);
	});
}

static void MightHaveFrontmatterFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	UnaryExecutor::Execute<string_t, bool>(args.data[0], result, args.size(),
	                                       [&](string_t content) { return MightHaveFrontmatter(content.GetString()); });
}

static void LoadYamlTextFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	UnaryExecutor::ExecuteWithNulls<string_t, string_t>(
	    args.data[0], result, args.size(), [&](string_t text, ValidityMask &mask, idx_t idx) {
		    auto yaml = DecodeYamlOrThrow(text.GetString());
		    if (!yaml) {
			    mask.SetInvalid(idx);
			    return string_t();
		    }
		    return StringVector::AddString(result, yaml->ToJson());
	    });
}

static ScalarFunctionSet FrontmatterFunctionSet(const string &name, const LogicalType &return_type,
                                                scalar_function_t function) {
	ScalarFunctionSet set(name);
	set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, return_type, function));
	set.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR}, return_type, function));
	return set;
}

static void LoadInternal(ExtensionLoader &loader) {
	ExtensionHelper::TryAutoLoadExtension(loader.GetDatabaseInstance(), "json");

	auto &config = DBConfig::GetConfig(loader.GetDatabaseInstance());
	config.AddExtensionOption(WARN_ERROR_SETTING, "Raise frontmatter problems as errors instead of logging warnings",
	                          LogicalType::BOOLEAN, Value::BOOLEAN(false));
	config.AddExtensionOption(FRONTMATTER_ON_ERROR_SETTING,
	                          "What to do with malformed frontmatter: 'warn_or_error' or 'ignore'",
	                          LogicalType::VARCHAR, Value("warn_or_error"));

	TableFunction read_docs_function("read_docs", {LogicalType::VARCHAR}, ReadDocsFunction, ReadDocsBind,
	                                 ReadDocsInitGlobal);
	read_docs_function.named_parameters["package_name"] = LogicalType::VARCHAR;
	read_docs_function.named_parameters["paths"] = LogicalType::LIST(LogicalType::VARCHAR);
	read_docs_function.cardinality = ReadDocsCardinality;
	loader.RegisterFunction(read_docs_function);

	loader.RegisterFunction(
	    FrontmatterFunctionSet("frontmatter_properties", LogicalType::JSON(), FrontmatterPropertiesFunction));
	loader.RegisterFunction(FrontmatterFunctionSet("frontmatter_body", LogicalType::VARCHAR, FrontmatterBodyFunction));
	loader.RegisterFunction(ScalarFunction("might_have_frontmatter", {LogicalType::VARCHAR}, LogicalType::BOOLEAN,
	                                       MightHaveFrontmatterFunction));
	loader.RegisterFunction(
	    ScalarFunction("load_yaml_text", {LogicalType::VARCHAR}, LogicalType::JSON(), LoadYamlTextFunction));
}

void DocblocksExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}
std::string DocblocksExtension::Name() {
	return "docblocks";
}

std::string DocblocksExtension::Version() const {
#ifdef EXT_VERSION_DOCBLOCKS
	return EXT_VERSION_DOCBLOCKS;
#else
	return "";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(docblocks, loader) {
	duckdb::LoadInternal(loader);
}
}
