#include "blocksplit/Schema.hpp"
#include "blocksplit/Errors.hpp"

#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace blocksplit
{
namespace
{

std::string quoted(std::string const& value)
{
    std::string out = "\"";
    for(char c: value) {
        switch(c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if(static_cast<unsigned char>(c) < 0x20) {
                char escaped[8];
                std::snprintf(escaped,
                              sizeof(escaped),
                              "\\u%04x",
                              static_cast<unsigned int>(c));
                out += escaped;
            } else {
                out.push_back(c);
            }
        }
    }
    out.push_back('"');
    return out;
}

FieldType parse_field_type(boost::property_tree::ptree const& node,
                           std::string const& field_name)
{
    // A bare type name is a leaf, {"type": ...} is a nested annotation
    // object and anything else (unions are arrays) is unsupported
    if(node.empty()) {
        return field_type_from_string(node.data());
    }
    auto nested = node.get_optional<std::string>("type");
    if(nested) {
        return field_type_from_string(*nested);
    }
    throw ConfigurationError("Unsupported type for field '" + field_name +
                             "': only primitive types are supported");
}

} // namespace

FieldType field_type_from_string(std::string const& name)
{
    if(name == "null") {
        return FieldType::NULL_TYPE;
    } else if(name == "boolean") {
        return FieldType::BOOLEAN;
    } else if(name == "int") {
        return FieldType::INT;
    } else if(name == "long") {
        return FieldType::LONG;
    } else if(name == "float") {
        return FieldType::FLOAT;
    } else if(name == "double") {
        return FieldType::DOUBLE;
    } else if(name == "bytes") {
        return FieldType::BYTES;
    } else if(name == "string") {
        return FieldType::STRING;
    }
    throw ConfigurationError("Unsupported field type: '" + name + "'");
}

std::string to_string(FieldType type)
{
    switch(type) {
    case FieldType::NULL_TYPE:
        return "null";
    case FieldType::BOOLEAN:
        return "boolean";
    case FieldType::INT:
        return "int";
    case FieldType::LONG:
        return "long";
    case FieldType::FLOAT:
        return "float";
    case FieldType::DOUBLE:
        return "double";
    case FieldType::BYTES:
        return "bytes";
    case FieldType::STRING:
        return "string";
    }
    throw std::logic_error("Unknown FieldType");
}

Schema::Schema()
{
}

Schema::Schema(std::string name,
               std::vector<Field> fields,
               std::string name_space)
    : _name(std::move(name)), _name_space(std::move(name_space)),
      _fields(std::move(fields))
{
}

Schema Schema::parse(std::string const& json)
{
    namespace pt = boost::property_tree;
    pt::ptree tree;
    std::istringstream stream(json);
    try {
        pt::read_json(stream, tree);
    } catch(pt::json_parser_error const& e) {
        throw ConfigurationError(std::string("Unable to parse schema: ") +
                                 e.what());
    }

    auto type = tree.get_optional<std::string>("type");
    if(!type || *type != "record") {
        throw ConfigurationError(
            "Unsupported schema: only record schemas are supported");
    }
    auto name = tree.get_optional<std::string>("name");
    if(!name || name->empty()) {
        throw ConfigurationError("Record schema has no name");
    }
    auto fields_node = tree.get_child_optional("fields");
    if(!fields_node) {
        throw ConfigurationError("Record schema '" + *name +
                                 "' has no fields");
    }

    std::vector<Field> fields;
    for(auto const& entry: *fields_node) {
        pt::ptree const& field_node = entry.second;
        auto field_name = field_node.get_optional<std::string>("name");
        if(!field_name || field_name->empty()) {
            throw ConfigurationError("Field without a name in schema '" +
                                     *name + "'");
        }
        auto type_node = field_node.get_child_optional("type");
        if(!type_node) {
            throw ConfigurationError("Field '" + *field_name +
                                     "' has no type");
        }
        fields.push_back({*field_name, parse_field_type(*type_node, *field_name)});
    }
    Schema schema(*name,
                  std::move(fields),
                  tree.get<std::string>("namespace", ""));
    BOOST_LOG_TRIVIAL(debug) << "Parsed schema " << schema.full_name()
                             << " with " << schema.fields().size()
                             << " fields";
    return schema;
}

std::string const& Schema::name() const
{
    return _name;
}

std::string const& Schema::name_space() const
{
    return _name_space;
}

std::string Schema::full_name() const
{
    return _name_space.empty() ? _name : _name_space + "." + _name;
}

std::vector<Field> const& Schema::fields() const
{
    return _fields;
}

std::size_t Schema::field_index(std::string const& field_name) const
{
    for(std::size_t ii = 0; ii < _fields.size(); ++ii) {
        if(_fields[ii].name == field_name) {
            return ii;
        }
    }
    throw std::out_of_range("No field named '" + field_name +
                            "' in schema " + full_name());
}

std::string Schema::to_json() const
{
    std::ostringstream oss;
    oss << "{\"type\":\"record\",\"name\":" << quoted(_name);
    if(!_name_space.empty()) {
        oss << ",\"namespace\":" << quoted(_name_space);
    }
    oss << ",\"fields\":[";
    for(std::size_t ii = 0; ii < _fields.size(); ++ii) {
        if(ii > 0) {
            oss << ",";
        }
        oss << "{\"name\":" << quoted(_fields[ii].name)
            << ",\"type\":" << quoted(to_string(_fields[ii].type)) << "}";
    }
    oss << "]}";
    return oss.str();
}

bool Schema::operator==(Schema const& other) const
{
    if(_name != other._name || _name_space != other._name_space ||
       _fields.size() != other._fields.size()) {
        return false;
    }
    for(std::size_t ii = 0; ii < _fields.size(); ++ii) {
        if(_fields[ii].name != other._fields[ii].name ||
           _fields[ii].type != other._fields[ii].type) {
            return false;
        }
    }
    return true;
}

bool Schema::operator!=(Schema const& other) const
{
    return !(*this == other);
}

} // namespace blocksplit
