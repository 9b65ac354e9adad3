#include "fmx_json.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

namespace {

  fmx_variant nlohmann_to_fmx(const nlohmann::json& j_val) {
    if (j_val.is_null()) {
      return fmx_variant();
    }
    if (j_val.is_boolean()) {
      return fmx_variant(j_val.get<bool>());
    }
    if (j_val.is_number_unsigned()) {
      unsigned long long u_val = j_val.get<unsigned long long>();
      if (u_val > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        std::cerr << "Warning: Unsigned JSON number " << u_val << " too large, converting to double." << std::endl;
        return fmx_variant(static_cast<double>(u_val));
      }
      return fmx_variant(static_cast<long long>(u_val));
    }
    if (j_val.is_number_integer()) {
      return fmx_variant(j_val.get<long long>());
    }
    if (j_val.is_number_float()) {
      return fmx_variant(j_val.get<double>());
    }
    if (j_val.is_string()) {
      return fmx_variant(fmx_string(j_val.get<std::string>()));
    }
    if (j_val.is_array()) {
      fmxv_vector vec;
      vec.reserve(j_val.size());
      for (const auto& el : j_val) {
        vec.push_back(nlohmann_to_fmx(el));
      }
      return fmx_variant(vec);
    }
    if (j_val.is_object()) {
      fmxv_map map_val;
      for (auto it = j_val.begin(); it != j_val.end(); ++it) {
        map_val[fmx_string(it.key())] = nlohmann_to_fmx(it.value());
      }
      return fmx_variant(map_val);
    }
    std::cerr << "Warning: Unsupported JSON value type, stored as null." << std::endl;
    return fmx_variant();
  }

  nlohmann::json fmx_to_nlohmann(const fmx_variant& var) {
    switch (var.in_state()) {
      case fmx_variant::string_state:
        return var.string_value().to_std_const();
      case fmx_variant::int_state:
        return var.int_value();
      case fmx_variant::bool_state:
        return var.bool_value();
      case fmx_variant::double_state:
        return var.double_value();
      case fmx_variant::vector_state: {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& el : var.vector_value()) {
          arr.push_back(fmx_to_nlohmann(el));
        }
        return arr;
      }
      case fmx_variant::map_state: {
        nlohmann::json obj = nlohmann::json::object();
        for (const auto& pair : var.map_value()) {
          obj[pair.first.to_std_const()] = fmx_to_nlohmann(pair.second);
        }
        return obj;
      }
      case fmx_variant::none:
      default:
        return nullptr;
    }
  }

}

fmx_json::fmx_json(fmxv_map* map_ptr) : data_map(map_ptr) {
  if (!data_map) {
    std::cerr << "Error: fmx_json constructor received a nullptr for data_map." << std::endl;
  }
}

bool fmx_json::parse(const fmx_string& json_string) {
  if (!data_map) {
    std::cerr << "Error: fmx_json::parse called on a null data_map." << std::endl;
    return false;
  }

  data_map->clear();

  try {
    nlohmann::json parsed_json = nlohmann::json::parse(json_string.to_std_const());

    if (parsed_json.is_object()) {
      for (auto it = parsed_json.begin(); it != parsed_json.end(); ++it) {
        (*data_map)[fmx_string(it.key())] = nlohmann_to_fmx(it.value());
      }
      return true;
    }

    std::cerr << "Error: JSON string does not represent an object at the top level." << std::endl;
    return false;

  } catch (const nlohmann::json::parse_error& e) {
    std::cerr << "Error: JSON parse error: " << e.what()
              << " at byte " << e.byte << std::endl;
    return false;
  }
}

bool fmx_json::load_file(const fmx_string& path) {
  std::ifstream file(path.c_str());
  if (!file.is_open()) {
    std::cerr << "Error: cannot open JSON file " << path << std::endl;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(fmx_string(buffer.str()));
}

fmx_string fmx_json::create(int indent) const {
  if (!data_map) {
    std::cerr << "Error: fmx_json::create called on a null data_map." << std::endl;
    return fmx_string("");
  }

  nlohmann::json j_obj = nlohmann::json::object();
  for (const auto& pair : *data_map) {
    j_obj[pair.first.to_std_const()] = fmx_to_nlohmann(pair.second);
  }

  try {
    // invalid UTF-8 from a PDF text layer is replaced instead of throwing
    return fmx_string(j_obj.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace));
  } catch (const nlohmann::json::type_error& e) {
    std::cerr << "Error: JSON dump type error: " << e.what() << std::endl;
    return fmx_string("");
  }
}
