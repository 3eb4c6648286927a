#ifndef CATALYST_TYPES_CONTEXT_H
#define CATALYST_TYPES_CONTEXT_H

#include <nlohmann/json.hpp>
#include <memory>

namespace catalyst {

// 统一使用 nlohmann::json 表示 atom 的结果与调用方输入
using Value = nlohmann::json;
using Context = nlohmann::json;

// The caller's inputs. Identity is what counts: a new pointer is a new set of
// inputs even when the contents compare equal.
using InputsRef = std::shared_ptr<const Context>;

inline InputsRef make_inputs(Context inputs) {
    return std::make_shared<const Context>(std::move(inputs));
}

} // namespace catalyst

#endif // CATALYST_TYPES_CONTEXT_H
