#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <wasmbox/runtime/entry_point.h>

namespace wasmbox::runtime
{

namespace
{

std::string type_list(const std::vector<ValueType>& types)
{
    std::string out = "[";
    for (std::size_t i = 0; i < types.size(); ++i)
    {
        if (i > 0)
        {
            out += " ";
        }
        out += to_string(types[i]);
    }
    return out + "]";
}

const ExportedFunc* find_export(const std::vector<ExportedFunc>& exports, const std::string& name)
{
    for (const ExportedFunc& exp : exports)
    {
        if (exp.name == name)
        {
            return &exp;
        }
    }
    return nullptr;
}

} // namespace

std::string_view to_string(EntryKind kind)
{
    switch (kind)
    {
    case EntryKind::LegacyStart:
        return "_start";
    case EntryKind::LegacyMain:
        return "main";
    case EntryKind::ComponentRun:
        return "wasi:cli/run";
    }
    return "unknown";
}

std::string_view to_string(ValueType type)
{
    switch (type)
    {
    case ValueType::I32:
        return "i32";
    case ValueType::I64:
        return "i64";
    case ValueType::F32:
        return "f32";
    case ValueType::F64:
        return "f64";
    case ValueType::V128:
        return "v128";
    case ValueType::FuncRef:
        return "funcref";
    case ValueType::ExternRef:
        return "externref";
    case ValueType::AnyRef:
        return "anyref";
    }
    return "unknown";
}

std::string to_string(const Signature& signature)
{
    return type_list(signature.params) + " -> " + type_list(signature.results);
}

const std::vector<EntryCandidate>& module_entry_candidates()
{
    static const std::vector<EntryCandidate> candidates = {
        EntryCandidate{.name = "_start", .signature = Signature{}, .kind = EntryKind::LegacyStart},
        EntryCandidate{.name = "main",
                       .signature = Signature{.params = {}, .results = {ValueType::I32}},
                       .kind = EntryKind::LegacyMain},
    };
    return candidates;
}

std::variant<EntryCandidate, EntryPointNotFound>
resolve_module_entry(const std::vector<ExportedFunc>& exports)
{
    std::string skipped;
    for (const EntryCandidate& candidate : module_entry_candidates())
    {
        const ExportedFunc* exp = find_export(exports, candidate.name);
        if (exp == nullptr)
        {
            continue;
        }
        if (exp->signature == candidate.signature)
        {
            return candidate;
        }
        skipped += "; `" + candidate.name + "` has type " + to_string(exp->signature) +
                   ", expected " + to_string(candidate.signature);
    }
    return EntryPointNotFound{"no entry point: expected an export `_start: [] -> []` or "
                              "`main: [] -> [i32]`" +
                              skipped};
}

} // namespace wasmbox::runtime
