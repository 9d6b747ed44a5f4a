/***
 * Name: tycast::registry::BuiltinRegistry::Defaults
 * Purpose: Compiled-in subset of the standard library's class properties and
 *   function signatures.
 * Inputs: none
 * Outputs: A fully built registry
 * Theory of Operation:
 *   Stands in for the on-disk tables when no loader installs its own registry.
 *   Function keys are global-namespace qualified ("\strlen"). Type names use the
 *   same union grammar as every other type string.
 */
#include "tycast/registry/BuiltinRegistry.h"

namespace tycast::registry {

namespace {

void addClasses(BuiltinRegistry::Builder& builder) {
  for (const char* cls : {"Exception", "Error"}) {
    builder.addClassProperty(cls, "message", "string")
        .addClassProperty(cls, "code", "int")
        .addClassProperty(cls, "file", "string")
        .addClassProperty(cls, "line", "int")
        .addClassProperty(cls, "previous", "?Throwable");
  }
  builder.addClassProperty("ErrorException", "severity", "int");

  builder.addClassProperty("DateInterval", "y", "int")
      .addClassProperty("DateInterval", "m", "int")
      .addClassProperty("DateInterval", "d", "int")
      .addClassProperty("DateInterval", "h", "int")
      .addClassProperty("DateInterval", "i", "int")
      .addClassProperty("DateInterval", "s", "int")
      .addClassProperty("DateInterval", "f", "float")
      .addClassProperty("DateInterval", "invert", "int")
      .addClassProperty("DateInterval", "days", "int|bool");

  builder.addClassProperty("DOMNode", "nodeName", "string")
      .addClassProperty("DOMNode", "nodeValue", "?string")
      .addClassProperty("DOMNode", "nodeType", "int")
      .addClassProperty("DOMNode", "parentNode", "?DOMNode")
      .addClassProperty("DOMNode", "childNodes", "DOMNodeList")
      .addClassProperty("DOMNode", "textContent", "string");
  builder.addClassProperty("DOMNodeList", "length", "int");

  builder.addClass("Closure").addClass("stdClass").addClass("ArrayObject");
}

void addFunctions(BuiltinRegistry::Builder& builder) {
  using types::QualifiedName;
  const auto fn = [](const char* name) { return QualifiedName::fromParts("", name); };

  builder.addFunction(fn("strlen"), "int", {{"string", "string"}});
  builder.addFunction(fn("strtolower"), "string", {{"string", "string"}});
  builder.addFunction(fn("strtoupper"), "string", {{"string", "string"}});
  builder.addFunction(fn("substr"), "string", {{"string", "string"}, {"offset", "int"}, {"length", "?int"}});
  builder.addFunction(fn("strpos"), "int|bool",
                      {{"haystack", "string"}, {"needle", "string"}, {"offset", "int"}});
  builder.addFunction(fn("str_replace"), "string|string[]",
                      {{"search", "string|string[]"}, {"replace", "string|string[]"},
                       {"subject", "string|string[]"}, {"count", "int"}});
  builder.addFunction(fn("sprintf"), "string", {{"format", "string"}, {"values", "mixed"}});
  builder.addFunction(fn("implode"), "string", {{"separator", "string"}, {"array", "array"}});
  builder.addFunction(fn("explode"), "string[]",
                      {{"separator", "string"}, {"string", "string"}, {"limit", "int"}});
  builder.addFunction(fn("count"), "int", {{"value", "array"}, {"mode", "int"}});
  builder.addFunction(fn("in_array"), "bool", {{"needle", "mixed"}, {"haystack", "array"}, {"strict", "bool"}});
  builder.addFunction(fn("array_keys"), "array",
                      {{"array", "array"}, {"filter_value", "mixed"}, {"strict", "bool"}});
  builder.addFunction(fn("array_merge"), "array", {{"arrays", "array"}});
  builder.addFunction(fn("intval"), "int", {{"value", "mixed"}, {"base", "int"}});
  builder.addFunction(fn("floatval"), "float", {{"value", "mixed"}});
  builder.addFunction(fn("is_null"), "bool", {{"value", "mixed"}});
  builder.addFunction(fn("abs"), "int|float", {{"num", "int|float"}});
  builder.addFunction(fn("json_encode"), "string|bool", {{"value", "mixed"}, {"flags", "int"}, {"depth", "int"}});
  builder.addFunction(fn("json_decode"), "mixed",
                      {{"json", "string"}, {"associative", "?bool"}, {"depth", "int"}, {"flags", "int"}});
  builder.addFunction(fn("fopen"), "resource|bool",
                      {{"filename", "string"}, {"mode", "string"}, {"use_include_path", "bool"}});
  builder.addFunction(fn("time"), "int", {});
  builder.addFunction(fn("microtime"), "string|float", {{"as_float", "bool"}});
}

}  // namespace

BuiltinRegistry BuiltinRegistry::Defaults() {
  Builder builder;
  addClasses(builder);
  addFunctions(builder);
  return builder.build();
}

}  // namespace tycast::registry
