#include "ResultsReporter.hpp"

#ifdef _WIN32
#include <json/json.h>
#elif __APPLE__
#include <json/json.h>
#else
#include <jsoncpp/json/json.h>
#endif

namespace {

Json::Value optional_year(const std::optional<int>& year)
{
    return year ? Json::Value(*year) : Json::Value(Json::nullValue);
}

}


Json::Value ResultsReporter::file_to_json(const FileRecord& file)
{
    Json::Value obj(Json::objectValue);
    obj["path"] = file.path;
    obj["name"] = file.display_name;
    obj["is_directory"] = file.is_directory;
    obj["year"] = optional_year(file.year);
    obj["container"] = file.container;
    obj["version_tag"] = file.version_tag ? Json::Value(*file.version_tag) : Json::Value(Json::nullValue);
    return obj;
}


Json::Value ResultsReporter::to_json(const std::vector<LogicalEntry>& entries)
{
    Json::Value root(Json::arrayValue);
    for (const auto& entry : entries) {
        Json::Value obj(Json::objectValue);
        obj["name"] = entry.name;
        obj["year"] = optional_year(entry.year);
        obj["extra_kind"] = entry.extra_kind ? Json::Value(to_string(*entry.extra_kind))
                                             : Json::Value(Json::nullValue);

        Json::Value files(Json::arrayValue);
        for (const auto& file : entry.files) {
            files.append(file_to_json(file));
        }
        obj["files"] = files;

        Json::Value alternates(Json::arrayValue);
        for (const auto& file : entry.alternate_versions) {
            alternates.append(file_to_json(file));
        }
        obj["alternate_versions"] = alternates;

        root.append(obj);
    }
    return root;
}


std::string ResultsReporter::to_json_string(const std::vector<LogicalEntry>& entries, bool pretty)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    return Json::writeString(builder, to_json(entries));
}
