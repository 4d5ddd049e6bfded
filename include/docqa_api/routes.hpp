#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "server.hpp"

namespace docqa_core {
class QaService;
struct Answer;
struct Document;
}  // namespace docqa_core

namespace docqa_api {

class Routes {
 public:
  explicit Routes(std::shared_ptr<docqa_core::QaService> qa_service);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  static nlohmann::json answer_to_json(const docqa_core::Answer &answer);
  static nlohmann::json document_to_json(const docqa_core::Document &document);

 private:
  std::shared_ptr<docqa_core::QaService> qa_service_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_ingest(const crow::request &req);
  crow::response handle_reingest(const crow::request &req, const std::string &document_id);
  crow::response handle_delete_document(const crow::request &req, const std::string &document_id);
  crow::response handle_list_documents(const crow::request &req);
  crow::response handle_ask(const crow::request &req);
  crow::response handle_index_stats(const crow::request &req);

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace docqa_api
