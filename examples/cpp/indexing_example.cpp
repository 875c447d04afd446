#include <iostream>
#include <string>
#include <vector>

#include "codeintel/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

namespace {

codeintel::v1::CodeBlock Method(const std::string& id, const std::string& signature, const std::vector<std::string>& calls, const std::string& file) {
  codeintel::v1::CodeBlock block;
  block.set_id(id);
  block.set_signature(signature);
  block.set_file_path(file);
  block.set_type("method");
  for (const auto& call : calls) block.add_calls(call);
  return block;
}

} // namespace

int main(int argc, char** argv) {
  // Optional YAML config; the built-in defaults write under ./data.
  auto config = argc > 1 ? codeintel::config::ConfigLoader::LoadFromYaml(argv[1]) : codeintel::config::ConfigLoader::Defaults();
  codeintel::observability::InitializeLogging(config);

  try {
    auto runtime = codeintel::factory::Build(config);

    std::vector<codeintel::v1::CodeBlock> blocks = {
        Method("OrderController.submit", "Order submit(OrderRequest request)", {"validate", "save"}, "src/OrderController.java"),
        Method("OrderValidator.validate", "void validate(OrderRequest request)", {}, "src/OrderValidator.java"),
        Method("OrderRepository.save", "Order save(Order order)", {}, "src/OrderRepository.java"),
    };

    std::cout << runtime.indexing->Reindex(std::string("orders"), blocks) << "\n\n";
    std::cout << runtime.graph_store->NeighborsText(std::string("orders"), "orders::OrderController.submit") << "\n\n";

    for (const auto& [file, targets] : runtime.graph_store->GetFileDependencies(std::string("orders"))) {
      for (const auto& target : targets) {
        std::cout << file << " -> " << target << "\n";
      }
    }
  } catch (const std::exception& e) {
    CODEINTEL_LOG_ERROR("indexing example failed", {codeintel::observability::StringField("error", e.what())});
    codeintel::observability::ShutdownLogging();
    return 2;
  }

  codeintel::observability::ShutdownLogging();
  return 0;
}
