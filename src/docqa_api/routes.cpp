#include "docqa_api/routes.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <vector>

#include "docqa_core/errors.hpp"
#include "docqa_core/services/qa_service.hpp"

namespace docqa_api {

namespace {

std::string to_iso8601(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

nlohmann::json ingest_result_to_json(const docqa_core::IngestResult &result) {
  return {{"document_id", result.document_id},
          {"chunk_count", result.chunk_count},
          {"page_count", result.page_count},
          {"skipped", result.skipped}};
}

}  // namespace

Routes::Routes(std::shared_ptr<docqa_core::QaService> qa_service)
    : qa_service_(std::move(qa_service)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/documents")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_ingest(req); });

  CROW_ROUTE(app, "/documents")
      .methods(crow::HTTPMethod::GET)(
          [this](const crow::request &req) { return handle_list_documents(req); });

  CROW_ROUTE(app, "/documents/<string>")
      .methods(crow::HTTPMethod::PUT)(
          [this](const crow::request &req, const std::string &document_id) {
            return handle_reingest(req, document_id);
          });

  CROW_ROUTE(app, "/documents/<string>")
      .methods(crow::HTTPMethod::DELETE)(
          [this](const crow::request &req, const std::string &document_id) {
            return handle_delete_document(req, document_id);
          });

  CROW_ROUTE(app, "/ask").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_ask(req);
  });

  CROW_ROUTE(app, "/index/stats")
  ([this](const crow::request &req) { return handle_index_stats(req); });

  std::cout << "[Routes] All routes registered" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("DocQA API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::handle_ingest(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    const std::string document_id = body.at("document_id").get<std::string>();
    const std::string filename = body.value("filename", document_id);
    const std::string text = body.at("text").get<std::string>();

    std::cout << "[Routes] Ingesting document: " << document_id << std::endl;
    docqa_core::IngestResult result = qa_service_->ingest(document_id, filename, text);
    return create_json_response(create_success_response(
        result.skipped ? "Document already ingested" : "Document ingested",
        ingest_result_to_json(result)));
  } catch (const docqa_core::DuplicateIdError &e) {
    return create_json_response(create_error_response(e.what()), 409);
  } catch (const docqa_core::EmbeddingServiceError &e) {
    std::cerr << "[Routes] Embedding failed during ingest: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 503);
  } catch (const std::exception &e) {
    std::cerr << "[Routes] Exception in handle_ingest: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 400);
  }
}

crow::response Routes::handle_reingest(const crow::request &req, const std::string &document_id) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    const std::string filename = body.value("filename", document_id);
    const std::string text = body.at("text").get<std::string>();

    std::cout << "[Routes] Re-ingesting document: " << document_id << std::endl;
    docqa_core::IngestResult result = qa_service_->reingest(document_id, filename, text);
    return create_json_response(
        create_success_response("Document re-ingested", ingest_result_to_json(result)));
  } catch (const docqa_core::DuplicateIdError &e) {
    return create_json_response(create_error_response(e.what()), 409);
  } catch (const docqa_core::EmbeddingServiceError &e) {
    std::cerr << "[Routes] Embedding failed during re-ingest: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 503);
  } catch (const std::exception &e) {
    std::cerr << "[Routes] Exception in handle_reingest: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 400);
  }
}

crow::response Routes::handle_delete_document(const crow::request &req,
                                              const std::string &document_id) {
  try {
    const bool deleted = qa_service_->delete_document(document_id);
    return create_json_response(create_success_response(
        deleted ? "Document deleted" : "Document not found",
        {{"document_id", document_id}, {"deleted", deleted}}));
  } catch (const docqa_core::DuplicateIdError &e) {
    return create_json_response(create_error_response(e.what()), 409);
  } catch (const std::exception &e) {
    std::cerr << "[Routes] Exception in handle_delete_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_list_documents(const crow::request &req) {
  try {
    nlohmann::json documents = nlohmann::json::array();
    for (const auto &document : qa_service_->list_documents()) {
      documents.push_back(document_to_json(document));
    }
    nlohmann::json response = create_success_response("Documents retrieved");
    response["data"]["documents"] = documents;
    response["data"]["count"] = documents.size();
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "[Routes] Exception in handle_list_documents: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_ask(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    const std::string question = body.at("question").get<std::string>();
    std::optional<int> k;
    if (body.contains("k")) {
      k = body.at("k").get<int>();
    }
    docqa_core::RetrievalFilters filters;
    if (body.contains("document_ids")) {
      filters.document_ids = body.at("document_ids").get<std::vector<std::string>>();
    }

    std::cout << "[Routes] Question: " << question << std::endl;
    try {
      docqa_core::Answer answer = qa_service_->retrieve_and_answer(question, k, filters);
      return create_json_response(answer_to_json(answer));
    } catch (const docqa_core::EmptyIndexError &e) {
      std::cout << "[Routes] " << e.what() << std::endl;
      docqa_core::Answer answer =
          docqa_core::Answer::could_not_answer("no documents have been ingested");
      answer.model_name = qa_service_->generation_model();
      return create_json_response(answer_to_json(answer));
    }
  } catch (const std::exception &e) {
    std::cerr << "[Routes] Exception in handle_ask: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 400);
  }
}

crow::response Routes::handle_index_stats(const crow::request &req) {
  try {
    const docqa_core::IndexStats stats = qa_service_->index_stats();
    nlohmann::json data = {{"entry_count", stats.entry_count},
                           {"dimension", stats.dimension},
                           {"on_disk_bytes", stats.on_disk_bytes},
                           {"approximate", stats.approximate}};
    return create_json_response(create_success_response("Index statistics", data));
  } catch (const std::exception &e) {
    std::cerr << "[Routes] Exception in handle_index_stats: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

nlohmann::json Routes::answer_to_json(const docqa_core::Answer &answer) {
  nlohmann::json citations = nlohmann::json::array();
  for (const auto &citation : answer.citations) {
    citations.push_back({{"chunk_id", citation.chunk_id},
                         {"document_id", citation.document_id}});
  }
  nlohmann::json json = {{"success", true},
                         {"answered", answer.answered},
                         {"answer", answer.text},
                         {"citations", citations},
                         {"model_name", answer.model_name},
                         {"timestamp", to_iso8601(answer.answered_at)}};
  if (!answer.answered) {
    json["reason"] = answer.failure_reason;
  }
  return json;
}

nlohmann::json Routes::document_to_json(const docqa_core::Document &document) {
  return {{"id", document.id},
          {"filename", document.filename},
          {"content_hash", document.content_hash},
          {"ingested_at", to_iso8601(document.ingested_at)},
          {"page_count", document.page_count},
          {"chunk_count", document.chunk_count}};
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  try {
    nlohmann::json json = nlohmann::json::parse(body);
    if (!json.is_object()) {
      throw std::invalid_argument("Request body must be a JSON object");
    }
    return json;
  } catch (const nlohmann::json::parse_error &e) {
    throw std::invalid_argument(std::string("Invalid JSON: ") + e.what());
  }
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response = {{"success", true}, {"message", message}};
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  return {{"success", false}, {"error", error}};
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response response(status_code, json_data.dump());
  response.set_header("Content-Type", "application/json");
  return response;
}

}  // namespace docqa_api
