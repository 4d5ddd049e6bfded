#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "docqa_core/retrieval_config.hpp"
#include "docqa_core/service_context.hpp"

class Config {
 public:
  std::string api_base_url;
  std::string metadata_db_path;
  std::string index_path;
  std::string ollama_url;
  std::string embedding_model;
  std::string generation_model;
  int request_timeout_seconds;
  int db_pool_size;

  docqa_core::RetrievalConfig retrieval;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config root must be a JSON object");
    }
    Config config;

    config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
    config.metadata_db_path =
        json_config.value("metadata_db_path", std::string("./data/metadata.db"));
    config.index_path = json_config.value("index_path", std::string("./data/index/vectors.dqvi"));
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model =
        json_config.value("embedding_model", std::string("mxbai-embed-large"));
    config.generation_model = json_config.value("generation_model", std::string("llama3.2"));

    config.request_timeout_seconds = read_int(json_config, "request_timeout_seconds", 60);
    config.db_pool_size = read_int(json_config, "db_pool_size", 4);

    // Engine tuning lives under its own key; RetrievalConfig validates itself.
    config.retrieval = docqa_core::RetrievalConfig::from_json(
        json_config.value("retrieval", nlohmann::json::object()));

    config.validate();
    return config;
  }

  docqa_core::ContextSettings context_settings() const {
    docqa_core::ContextSettings settings;
    settings.metadata_db_path = metadata_db_path;
    settings.index_path = index_path;
    settings.ollama_url = ollama_url;
    settings.embedding_model = embedding_model;
    settings.generation_model = generation_model;
    settings.request_timeout_seconds = request_timeout_seconds;
    settings.db_pool_size = db_pool_size;
    settings.retrieval = retrieval;
    return settings;
  }

 private:
  static int read_int(const nlohmann::json& json_config, const std::string& key, int fallback) {
    if (!json_config.contains(key)) {
      return fallback;
    }
    const auto& value = json_config.at(key);
    if (!value.is_number_integer()) {
      throw std::runtime_error(key + " must be an integer");
    }
    return value.get<int>();
  }

  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must be of the form host:port");
    }
    if (metadata_db_path.empty()) {
      throw std::runtime_error("metadata_db_path cannot be empty");
    }
    if (index_path.empty()) {
      throw std::runtime_error("index_path cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (generation_model.empty()) {
      throw std::runtime_error("generation_model cannot be empty");
    }
    if (request_timeout_seconds < 1) {
      throw std::runtime_error("request_timeout_seconds must be at least 1");
    }
    if (db_pool_size < 1) {
      throw std::runtime_error("db_pool_size must be at least 1");
    }
  }
};
