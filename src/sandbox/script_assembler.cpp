#include "sandbox/script_assembler.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>
#include <stdexcept>

#include "utils/common.hpp"

namespace scriptbox::sandbox {
namespace {

constexpr const char* kImports = R"PY(import sys
import json
import traceback
import warnings

warnings.filterwarnings('ignore')

try:
    import pandas as pd
    import pandas
except Exception:
    pd = None
try:
    import numpy as np
except Exception:
    np = None
try:
    import matplotlib
    matplotlib.use('Agg')
    import matplotlib.pyplot as plt
except Exception:
    plt = None
try:
    import seaborn as sns
except Exception:
    sns = None
try:
    from scipy import stats
except Exception:
    stats = None
)PY";

constexpr const char* kReportHelper = R"PY(
def _scriptbox_report(stage, message, trace=''):
    if not _SCRIPTBOX_STATUS_PATH:
        return
    try:
        with open(_SCRIPTBOX_STATUS_PATH, 'w', encoding='utf-8') as _scriptbox_status:
            json.dump({'stage': stage, 'message': message, 'traceback': trace}, _scriptbox_status)
    except Exception:
        pass
)PY";

constexpr const char* kDatasetSummary = R"PY(    print(f'Dataset loaded: {df.shape[0]} rows, {df.shape[1]} columns')
    if np is not None:
        print(f'Numeric columns detected: {len(df.select_dtypes(include=[np.number]).columns)}')
except Exception as e:
    _scriptbox_report('data', 'Data loading failed: ' + str(e), traceback.format_exc())
    print('EXECUTION_ERROR: Data loading failed: ' + str(e))
    sys.exit(2)
)PY";

constexpr const char* kEpilogue = R"PY(except Exception as e:
    _scriptbox_report('user', str(e), traceback.format_exc())
    print('EXECUTION_ERROR: ' + str(e))
    traceback.print_exc()
    sys.exit(1)
_scriptbox_report('complete', '')
print('EXECUTION_COMPLETE')
)PY";

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

}  // namespace

std::string PythonStringLiteral(const std::string& value) {
    std::string literal = "'";
    for (const char c : value) {
        switch (c) {
            case '\\': literal += "\\\\"; break;
            case '\'': literal += "\\'"; break;
            case '\n': literal += "\\n"; break;
            case '\r': literal += "\\r"; break;
            case '\t': literal += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char escaped[5];
                    std::snprintf(escaped, sizeof(escaped), "\\x%02x", static_cast<unsigned char>(c));
                    literal += escaped;
                } else {
                    literal += c;
                }
        }
    }
    literal += "'";
    return literal;
}

bool IsSqlIdentifier(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    const auto first = static_cast<unsigned char>(value.front());
    if (!std::isalpha(first) && first != '_') {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

ScriptAssembler::ScriptAssembler(config::HarnessConfig config)
    : config_(std::move(config)) {}

nlohmann::json ScriptAssembler::InlinePayload(const DatasetRef& dataset) {
    nlohmann::json payload = nlohmann::json::object();
    payload["records"] = dataset.records.is_array() ? dataset.records : nlohmann::json::array();
    payload["columns"] = dataset.columns;
    return payload;
}

std::string ScriptAssembler::Assemble(const std::string& clean_code,
                                      const DatasetRef& dataset,
                                      const HarnessChannels& channels) const {
    std::ostringstream script;
    script << Preamble(channels) << "\n";
    script << DatasetRegion(dataset, channels) << "\n";
    script << UserRegion(clean_code);
    return script.str();
}

std::string ScriptAssembler::Preamble(const HarnessChannels& channels) const {
    std::ostringstream preamble;
    preamble << kImports << "\n";
    preamble << "_SCRIPTBOX_STATUS_PATH = " << PythonStringLiteral(channels.status_path) << "\n";
    preamble << kReportHelper;
    return preamble.str();
}

std::string ScriptAssembler::DatasetRegion(const DatasetRef& dataset,
                                           const HarnessChannels& channels) const {
    std::ostringstream region;
    region << "# Load data\n";
    switch (dataset.kind) {
        case DatasetKind::None:
            region << "df = None\n";
            return region.str();
        case DatasetKind::Inline:
            region << "try:\n";
            region << "    if pd is None:\n";
            region << "        raise ImportError('pandas is required to load the dataset')\n";
            region << "    with open(" << PythonStringLiteral(channels.data_path)
                   << ", 'r', encoding='utf-8') as _scriptbox_data:\n";
            region << "        _scriptbox_payload = json.load(_scriptbox_data)\n";
            region << "    df = pd.DataFrame(_scriptbox_payload['records'], "
                      "columns=_scriptbox_payload['columns'] or None)\n";
            break;
        case DatasetKind::Store: {
            const auto store_path = dataset.store_path.empty() ? config_.store_path : dataset.store_path;
            const auto view_name = dataset.view_name.empty() ? config_.store_view : dataset.view_name;
            if (store_path.empty()) {
                throw std::invalid_argument("no dataset store configured");
            }
            if (!IsSqlIdentifier(view_name)) {
                throw std::invalid_argument("invalid dataset view name: " + view_name);
            }
            region << "try:\n";
            region << "    import duckdb\n";
            region << "    _scriptbox_conn = duckdb.connect(" << PythonStringLiteral(store_path)
                   << ", read_only=True)\n";
            region << "    try:\n";
            region << "        df = _scriptbox_conn.execute('SELECT * FROM " << view_name << "').fetchdf()\n";
            region << "    finally:\n";
            region << "        _scriptbox_conn.close()\n";
            break;
        }
    }
    region << CoercionBlock();
    region << kDatasetSummary;
    return region.str();
}

std::string ScriptAssembler::CoercionBlock() const {
    std::vector<std::string> names;
    names.reserve(config_.categorical_columns.size());
    for (const auto& column : config_.categorical_columns) {
        names.push_back(PythonStringLiteral(ToLower(column)));
    }
    std::ostringstream block;
    block << "    _scriptbox_categorical = {" << utils::Join(names, ", ") << "}\n";
    // A column is replaced only when numeric conversion keeps every non-null value.
    block << "    for _scriptbox_col in list(df.columns):\n";
    block << "        if str(_scriptbox_col).lower() in _scriptbox_categorical:\n";
    block << "            continue\n";
    block << "        try:\n";
    block << "            _scriptbox_converted = pd.to_numeric(df[_scriptbox_col], errors='coerce')\n";
    block << "        except Exception:\n";
    block << "            continue\n";
    block << "        if _scriptbox_converted.notna().sum() >= df[_scriptbox_col].notna().sum():\n";
    block << "            df[_scriptbox_col] = _scriptbox_converted\n";
    return block.str();
}

std::string ScriptAssembler::UserRegion(const std::string& clean_code) const {
    std::ostringstream region;
    region << "# Execute user code\n";
    region << "try:\n";
    // Compiled from a literal so multi-line strings and traceback line numbers match the source.
    region << "    exec(compile(" << PythonStringLiteral(clean_code) << ", '<user_code>', 'exec'), globals())\n";
    region << kEpilogue;
    return region.str();
}

}  // namespace scriptbox::sandbox
