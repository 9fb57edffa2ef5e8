#include "adapters/AdapterFactory.hpp"
#include "adapters/BoostGraphAdapter.hpp"
#include "adapters/DatabaseAdapter.hpp"
#include "adapters/GraphSageAdapter.hpp"
#include <stdexcept>

namespace adapters {

GraphAdapterPtr AdapterFactory::create(Format format, const AdapterOptions& options) {
    switch (format) {
        case Format::Database:
            if (!options.database) {
                throw std::invalid_argument("The database format needs a database collaborator");
            }
            return std::make_unique<DatabaseAdapter>(options.database);
        case Format::BoostGraph:
            return std::make_unique<BoostGraphAdapter>();
        case Format::GraphSage:
            return std::make_unique<GraphSageAdapter>(GraphSageDataset{}, options.walkPolicy);
    }
    throw std::invalid_argument("Unknown format");
}

} // namespace adapters
