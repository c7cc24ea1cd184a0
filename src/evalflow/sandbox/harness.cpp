#include "evalflow/sandbox/harness.hpp"

#include <format>

namespace evalflow {

namespace {

// JSON text of `inputs`, itself encoded as a JSON string literal. JSON string
// escapes are a subset of both Python and JavaScript string escapes.
[[nodiscard]] auto quoted_json(const JsonValue &inputs) -> std::string {
  return dump_json(JsonValue(dump_json(inputs)));
}

[[nodiscard]] auto python_harness(std::string_view code,
                                  const JsonValue &inputs) -> std::string {
  std::string out;
  out.reserve(code.size() + 1024);
  out += "import json as __evalflow_json\n"
         "import sys as __evalflow_sys\n"
         "import traceback as __evalflow_traceback\n\n";
  out += "inputs = __evalflow_json.loads(" + quoted_json(inputs) + ")\n\n";
  out += code;
  out += "\n\n\n__evalflow_entry_points = (\n";
  for (const auto &entry : kPythonEntryPoints) {
    out += std::format(
        "    (\"{}\", {}),\n", entry.name,
        entry.argument == EntryArgument::ItemsOrInputs ? "True" : "False");
  }
  out += ")\n\n\n"
         "def __evalflow_call():\n"
         "    for name, unwrap_items in __evalflow_entry_points:\n"
         "        fn = globals().get(name)\n"
         "        if callable(fn):\n"
         "            if unwrap_items and isinstance(inputs, dict) and "
         "\"items\" in inputs:\n"
         "                return fn(inputs[\"items\"])\n"
         "            return fn(inputs)\n"
         "    return inputs\n\n\n"
         "try:\n"
         "    __evalflow_result = __evalflow_call()\n"
         "    __evalflow_sys.stdout.write(\"\\n\" + "
         "__evalflow_json.dumps(__evalflow_result, ensure_ascii=False) + "
         "\"\\n\")\n"
         "    __evalflow_sys.stdout.flush()\n"
         "except Exception:\n"
         "    __evalflow_traceback.print_exc()\n"
         "    __evalflow_sys.exit(1)\n";
  return out;
}

[[nodiscard]] auto javascript_probe(const EntryPoint &entry) -> std::string {
  if (entry.module_export) {
    return "typeof module.exports === \"function\" ? module.exports : "
           "(module.exports && typeof module.exports.default === "
           "\"function\" ? module.exports.default : undefined)";
  }
  return std::format("typeof {0} === \"function\" ? {0} : undefined",
                     entry.name);
}

// User code may declare a top-level `process` entry point, which shadows
// Node's global inside the module; the harness reaches it via globalThis.
[[nodiscard]] auto javascript_harness(std::string_view code,
                                      const JsonValue &inputs) -> std::string {
  std::string out;
  out.reserve(code.size() + 1024);
  out += "const inputs = JSON.parse(" + quoted_json(inputs) + ");\n\n";
  out += code;
  out += "\n\n;(async () => {\n"
         "  const __evalflowEntryPoints = [\n";
  for (const auto &entry : kJavascriptEntryPoints) {
    out += std::format(
        "    [{}, {}],\n", javascript_probe(entry),
        entry.argument == EntryArgument::ItemsOrInputs ? "true" : "false");
  }
  out += "  ];\n"
         "  try {\n"
         "    let result = inputs;\n"
         "    for (const [fn, unwrapItems] of __evalflowEntryPoints) {\n"
         "      if (!fn) continue;\n"
         "      const useItems = unwrapItems && inputs !== null && "
         "typeof inputs === \"object\" && inputs.items !== undefined;\n"
         "      result = await fn(useItems ? inputs.items : inputs);\n"
         "      break;\n"
         "    }\n"
         "    globalThis.process.stdout.write(\"\\n\" + "
         "JSON.stringify(result === "
         "undefined ? null : result) + \"\\n\");\n"
         "  } catch (error) {\n"
         "    console.error(error && error.stack ? error.stack : "
         "String(error));\n"
         "    globalThis.process.exitCode = 1;\n"
         "  }\n"
         "})();\n";
  return out;
}

} // namespace

auto entry_points(Language language) noexcept -> std::span<const EntryPoint> {
  if (language == Language::Javascript) {
    return kJavascriptEntryPoints;
  }
  return kPythonEntryPoints;
}

auto generate_harness(Language language, std::string_view code,
                      const JsonValue &inputs) -> std::string {
  switch (language) {
  case Language::Javascript:
    return javascript_harness(code, inputs);
  case Language::Python:
    break;
  }
  return python_harness(code, inputs);
}

} // namespace evalflow
