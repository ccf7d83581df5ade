#pragma once

#include <filesystem>

#include <yaml-cpp/yaml.h>

#include <hospes/schema/types.hpp>
#include <hospes/schema/value.hpp>

namespace hospes::schema {

// These throw std::invalid_argument on malformed documents and propagate
// YAML::Exception from the parser.
type_descriptor parse_type( const YAML::Node& node );
interface_schema load_schema( const YAML::Node& node );
interface_schema load_schema_file( const std::filesystem::path& path );

// Interprets a YAML value against the type it is meant to have.
value parse_value( const YAML::Node& node, const type_descriptor& type );

} // namespace hospes::schema
