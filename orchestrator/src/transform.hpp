#pragma once

#include <nlohmann/json.hpp>

// Declarative data pipeline used by transform steps. Each operation is an
// object with an "op" key (or a bare op name string):
//
//   get {path}            keys | values | count
//   filter {expr}         map {expr}            object {fields: {name: expr}}
//   pluck {field}         sort {by?, reverse?}  unique
//   join {separator}      split {separator}     lines
//   sum | min | max       first | last          default {value}
//   trim | lower | upper  to_number             regex_extract {pattern, group?}
//
// Expressions see the step scope plus "item" (and "index" over lists).

// Throws DefinitionError for unknown ops, bad expressions or bad patterns
void validate_transform(const nlohmann::json& operations);

// Throws StepFailure when an operation does not apply to its input
nlohmann::json apply_transform(const nlohmann::json& input, const nlohmann::json& operations,
                               const nlohmann::json& scope);
