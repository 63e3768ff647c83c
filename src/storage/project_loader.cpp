#include "storage/project_loader.hpp"

#include <fstream>
#include <sstream>

#include <boost/filesystem.hpp>

#include "storage/database_error.hpp"

namespace fs = boost::filesystem;
using nlohmann::json;

namespace calcflow::storage {
  using primitives::CalcJob;
  using primitives::Client;
  using primitives::Code;

  namespace {
    constexpr const char *kDefaultContentExtension = "txt";

    bool isTextEncoding(const std::string &encoding) {
      return encoding == "utf8" || encoding == "utf-8" || encoding == "ascii";
    }

    /// @return the string member @param field of @param item, if it is one
    std::optional<std::string> stringField(const json &item,
                                           const char *field) {
      auto it = item.find(field);
      if (it == item.end() || !it->is_string()) {
        return std::nullopt;
      }
      return it->get<std::string>();
    }
  }  // namespace

  ProjectLoader::ProjectLoader(std::shared_ptr<ContentStore> objects,
                               std::shared_ptr<MetadataStore> metadata)
      : objects_(std::move(objects)),
        metadata_(std::move(metadata)),
        logger_(base::createLogger("ProjectLoader")) {}

  outcome::result<LoadedRows> ProjectLoader::loadFile(const fs::path &path) {
    std::ifstream file(path.string());
    if (!file) {
      logger_->error("Cannot open {}", path.string());
      return LoaderError::UNREADABLE_FILE;
    }
    json document;
    try {
      file >> document;
    } catch (const json::exception &e) {
      logger_->error("{} is not valid JSON: {}", path.string(), e.what());
      return LoaderError::INVALID_DOCUMENT;
    }
    return load(document, path.parent_path());
  }

  outcome::result<LoadedRows> ProjectLoader::load(const json &document,
                                                  const fs::path &base_dir) {
    if (!document.is_object()) {
      logger_->error("Expected an object at the top level");
      return LoaderError::INVALID_DOCUMENT;
    }
    if (document.contains("objects") && !document["objects"].is_object()) {
      logger_->error("Expected an object for key 'objects'");
      return LoaderError::INVALID_DOCUMENT;
    }
    for (const char *key : {"clients", "codes", "calcjobs"}) {
      if (!document.contains(key)) {
        continue;
      }
      const auto &list = document[key];
      if (!list.is_array()) {
        logger_->error("Expected a list for key '{}'", key);
        return LoaderError::INVALID_DOCUMENT;
      }
      for (size_t idx = 0; idx < list.size(); ++idx) {
        if (!list[idx].is_object()) {
          logger_->error("Expected an object for item '{}[{}]'", key, idx);
          return LoaderError::INVALID_DOCUMENT;
        }
      }
    }

    LoadedRows rows;
    // objects are content addressed, storing them outside of the transaction
    // leaves at worst unreferenced blobs behind
    if (document.contains("objects")) {
      auto res = loadObjects(document["objects"], base_dir, rows);
      if (!res) {
        return outcome::failure(res.error());
      }
    }

    const json empty = json::array();
    auto res = metadata_->transaction([&]() -> outcome::result<void> {
      auto clients = loadClients(document.value("clients", empty), rows);
      if (!clients) {
        return clients;
      }
      auto codes = loadCodes(document.value("codes", empty), rows);
      if (!codes) {
        return codes;
      }
      return loadCalcJobs(document.value("calcjobs", empty), rows);
    });
    if (!res) {
      return outcome::failure(res.error());
    }
    logger_->info("Added {} objects, {} clients, {} codes, {} calcjobs",
                  rows.objects.size(),
                  rows.clients.size(),
                  rows.codes.size(),
                  rows.calcjobs.size());
    return rows;
  }

  outcome::result<void> ProjectLoader::loadObjects(const json &objects,
                                                   const fs::path &base_dir,
                                                   LoadedRows &rows) {
    for (const auto &[label, spec] : objects.items()) {
      if (!spec.is_object()) {
        logger_->error("Expected an object for object '{}'", label);
        return LoaderError::INVALID_ITEM;
      }
      outcome::result<ObjectKey> key = LoaderError::INVALID_ITEM;
      if (spec.contains("content")) {
        auto content = stringField(spec, "content");
        auto encoding = spec.value("encoding", std::string("utf8"));
        auto extension =
            spec.value("extension", std::string(kDefaultContentExtension));
        if (!content || !isTextEncoding(encoding)) {
          logger_->error("Expected UTF-8 string content for object '{}'",
                         label);
          return LoaderError::INVALID_ITEM;
        }
        key = objects_->put(*content, extension);
      } else if (auto path = stringField(spec, "path")) {
        fs::path file(*path);
        if (file.is_relative()) {
          file = base_dir / file;
        }
        key = objects_->putFile(file.string(),
                                spec.value("extension", std::string()));
        if (!key && key.error() == DatabaseError::NOT_FOUND) {
          logger_->error("File {} of object '{}' not found", file.string(),
                         label);
          return LoaderError::UNREADABLE_FILE;
        }
      } else {
        logger_->error("Expected either 'content' or 'path' for object '{}'",
                       label);
        return LoaderError::INVALID_ITEM;
      }
      if (!key) {
        logger_->error("Object '{}' cannot be stored: {}", label,
                       key.error().message());
        return outcome::failure(key.error());
      }
      rows.objects[label] = key.value();
    }
    return outcome::success();
  }

  outcome::result<void> ProjectLoader::loadClients(const json &clients,
                                                   LoadedRows &rows) {
    for (size_t idx = 0; idx < clients.size(); ++idx) {
      const auto &item = clients[idx];
      Client client;
      try {
        client.label = item.at("label").get<std::string>();
        client.client_url = item.at("client_url").get<std::string>();
        client.client_id = item.at("client_id").get<std::string>();
        client.client_secret = item.at("client_secret").get<std::string>();
        client.token_uri = item.at("token_uri").get<std::string>();
        client.machine_name = item.at("machine_name").get<std::string>();
        client.work_dir = item.at("work_dir").get<std::string>();
        client.small_file_size_mb =
            item.value("small_file_size_mb", client.small_file_size_mb);
      } catch (const json::exception &e) {
        logger_->error("clients[{}] item is invalid: {}", idx, e.what());
        return LoaderError::INVALID_ITEM;
      }
      auto pk = metadata_->insertClient(client);
      if (!pk) {
        logger_->error("clients[{}] item is invalid: {}", idx,
                       pk.error().message());
        return LoaderError::REJECTED;
      }
      rows.clients.push_back(pk.value());
    }
    return outcome::success();
  }

  outcome::result<void> ProjectLoader::loadCodes(const json &codes,
                                                 LoadedRows &rows) {
    for (size_t idx = 0; idx < codes.size(); ++idx) {
      const auto &item = codes[idx];
      const auto name = "codes[" + std::to_string(idx) + "]";

      auto client_label = stringField(item, "client_label");
      if (!client_label) {
        logger_->error("{} item has no 'client_label' key", name);
        return LoaderError::INVALID_ITEM;
      }
      auto client = metadata_->getClientByLabel(*client_label);
      if (!client) {
        logger_->error("{}['client_label'] = '{}' not found", name,
                       *client_label);
        return LoaderError::UNKNOWN_LABEL;
      }

      Code code;
      code.client_pk = client.value().pk;
      try {
        code.label = item.at("label").get<std::string>();
        code.script = item.at("script").get<std::string>();
      } catch (const json::exception &e) {
        logger_->error("{} item is invalid: {}", name, e.what());
        return LoaderError::INVALID_ITEM;
      }
      auto uploads = resolveUploads(item, rows, name);
      if (!uploads) {
        return outcome::failure(uploads.error());
      }
      code.upload_paths = std::move(uploads.value());

      auto pk = metadata_->insertCode(code);
      if (!pk) {
        logger_->error("{} item is invalid: {}", name, pk.error().message());
        return LoaderError::REJECTED;
      }
      rows.codes.push_back(pk.value());
    }
    return outcome::success();
  }

  outcome::result<void> ProjectLoader::loadCalcJobs(const json &calcjobs,
                                                    LoadedRows &rows) {
    for (size_t idx = 0; idx < calcjobs.size(); ++idx) {
      const auto &item = calcjobs[idx];
      const auto name = "calcjobs[" + std::to_string(idx) + "]";

      auto code_label = stringField(item, "code_label");
      if (!code_label) {
        logger_->error("{} item has no 'code_label' key", name);
        return LoaderError::INVALID_ITEM;
      }
      auto code = metadata_->getCodeByLabel(*code_label);
      if (!code) {
        logger_->error("{}['code_label'] = '{}' not found", name, *code_label);
        return LoaderError::UNKNOWN_LABEL;
      }

      CalcJob calcjob;
      calcjob.code_pk = code.value().pk;
      try {
        calcjob.label = item.value("label", std::string());
        calcjob.uuid = item.value("uuid", std::string());
        const auto parameters = item.value("parameters", json::object());
        for (const auto &[key, value] : parameters.items()) {
          // parameters are opaque text, non string scalars keep their JSON
          // spelling
          calcjob.parameters[key] =
              value.is_string() ? value.get<std::string>() : value.dump();
        }
        calcjob.download_globs = item.value("download_globs",
                                            std::vector<std::string>());
      } catch (const json::exception &e) {
        logger_->error("{} item is invalid: {}", name, e.what());
        return LoaderError::INVALID_ITEM;
      }
      auto uploads = resolveUploads(item, rows, name);
      if (!uploads) {
        return outcome::failure(uploads.error());
      }
      calcjob.upload_paths = std::move(uploads.value());

      auto pk = metadata_->insertCalcJob(calcjob);
      if (!pk) {
        logger_->error("{} item is invalid: {}", name, pk.error().message());
        return LoaderError::REJECTED;
      }
      rows.calcjobs.push_back(pk.value());
    }
    return outcome::success();
  }

  outcome::result<primitives::PathMap> ProjectLoader::resolveUploads(
      const json &item, const LoadedRows &rows, const std::string &name) const {
    primitives::PathMap paths;
    auto it = item.find("upload_paths");
    if (it == item.end()) {
      return paths;
    }
    if (!it->is_object()) {
      logger_->error("Expected an object for {}[upload_paths]", name);
      return LoaderError::INVALID_ITEM;
    }
    for (const auto &[path, value] : it->items()) {
      if (value.is_null()) {
        paths[path] = std::nullopt;
        continue;
      }
      if (!value.is_object()) {
        logger_->error("Expected an object or null for {}[upload_paths][{}]",
                       name, path);
        return LoaderError::INVALID_ITEM;
      }
      ObjectKey key;
      if (auto label = stringField(value, "label")) {
        auto found = rows.objects.find(*label);
        if (found == rows.objects.end()) {
          logger_->error("{}[upload_paths][{}]['label'] = '{}' not found",
                         name, path, *label);
          return LoaderError::UNKNOWN_LABEL;
        }
        key = found->second;
      } else if (auto direct = stringField(value, "key")) {
        key = *direct;
      } else {
        logger_->error("Expected either 'label' or 'key' for {}[upload_paths][{}]",
                       name, path);
        return LoaderError::INVALID_ITEM;
      }
      if (!objects_->exists(key)) {
        logger_->error("Key '{}' not found in storage for {}[upload_paths][{}]",
                       key, name, path);
        return LoaderError::MISSING_OBJECT;
      }
      paths[path] = key;
    }
    return paths;
  }

}  // namespace calcflow::storage
