#pragma once

#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/execution_types.hpp"

namespace scriptbox::sandbox {

// Files shared with the child for one execution.
struct HarnessChannels {
    std::string data_path;
    std::string status_path;
};

class ScriptAssembler {
public:
    explicit ScriptAssembler(config::HarnessConfig config);

    // Preamble, dataset materialization, guarded user code, epilogue.
    // Throws std::invalid_argument for an unusable store reference.
    std::string Assemble(const std::string& clean_code,
                         const DatasetRef& dataset,
                         const HarnessChannels& channels) const;

    // Contents of the data side-channel file for an inline dataset.
    static nlohmann::json InlinePayload(const DatasetRef& dataset);

private:
    std::string Preamble(const HarnessChannels& channels) const;
    std::string DatasetRegion(const DatasetRef& dataset, const HarnessChannels& channels) const;
    std::string CoercionBlock() const;
    std::string UserRegion(const std::string& clean_code) const;

    config::HarnessConfig config_;
};

std::string PythonStringLiteral(const std::string& value);

bool IsSqlIdentifier(const std::string& value);

}  // namespace scriptbox::sandbox
