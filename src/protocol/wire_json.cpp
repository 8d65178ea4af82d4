#include "mcpchat/protocol/wire_json.hpp"

#include <simdjson.h>

#include <cstdint>

namespace mcpchat {
namespace {

namespace od = simdjson::ondemand;

tl::unexpected<WireJsonError> fail(simdjson::error_code error) {
    return tl::unexpected(WireJsonError{simdjson::error_message(error)});
}

class Converter {
public:
    explicit Converter(std::size_t max_depth) : max_depth_(max_depth) {}

    // Works on both od::document (the root) and od::value.
    template <typename Node>
    WireJsonResult convert(Node& node, std::size_t depth) {
        od::json_type type;
        if (auto error = node.type().get(type); error) {
            return fail(error);
        }

        switch (type) {
            case od::json_type::object: {
                od::object object;
                if (auto error = node.get_object().get(object); error) {
                    return fail(error);
                }
                return convert_object(object, depth + 1);
            }
            case od::json_type::array: {
                od::array array;
                if (auto error = node.get_array().get(array); error) {
                    return fail(error);
                }
                return convert_array(array, depth + 1);
            }
            case od::json_type::string: {
                std::string_view text;
                if (auto error = node.get_string().get(text); error) {
                    return fail(error);
                }
                return Json(std::string(text));
            }
            case od::json_type::number:
                return convert_number(node);
            case od::json_type::boolean: {
                bool flag = false;
                if (auto error = node.get_bool().get(flag); error) {
                    return fail(error);
                }
                return Json(flag);
            }
            case od::json_type::null: {
                bool is_null = false;
                if (auto error = node.is_null().get(is_null); error || is_null == false) {
                    return fail(error ? error : simdjson::INCORRECT_TYPE);
                }
                return Json(nullptr);
            }
            default:
                break;
        }
        return tl::unexpected(WireJsonError{"unsupported JSON value"});
    }

private:
    template <typename Node>
    WireJsonResult convert_number(Node& node) {
        od::number number;
        if (auto error = node.get_number().get(number); error) {
            return fail(error);
        }
        if (number.is_int64() == true) {
            return Json(number.get_int64());
        }
        if (number.is_uint64() == true) {
            return Json(number.get_uint64());
        }
        return Json(number.as_double());
    }

    WireJsonResult convert_object(od::object& object, std::size_t depth) {
        if (depth > max_depth_) {
            return too_deep();
        }
        Json out = Json::object();
        for (auto field_result : object) {
            od::field field;
            if (auto error = std::move(field_result).get(field); error) {
                return fail(error);
            }
            std::string_view key;
            if (auto error = field.unescaped_key().get(key); error) {
                return fail(error);
            }
            std::string name(key);
            od::value value = field.value();
            auto converted = convert(value, depth);
            if (converted.has_value() == false) {
                return converted;
            }
            out[std::move(name)] = std::move(*converted);
        }
        return out;
    }

    WireJsonResult convert_array(od::array& array, std::size_t depth) {
        if (depth > max_depth_) {
            return too_deep();
        }
        Json out = Json::array();
        for (auto element_result : array) {
            od::value element;
            if (auto error = std::move(element_result).get(element); error) {
                return fail(error);
            }
            auto converted = convert(element, depth);
            if (converted.has_value() == false) {
                return converted;
            }
            out.push_back(std::move(*converted));
        }
        return out;
    }

    tl::unexpected<WireJsonError> too_deep() const {
        return tl::unexpected(WireJsonError{
            "nesting deeper than " + std::to_string(max_depth_) + " levels"});
    }

    std::size_t max_depth_;
};

}  // namespace

WireJsonResult parse_wire_json(std::string_view text, std::size_t max_depth) {
    thread_local od::parser parser;

    // simdjson reads past the end of its input; padded_string owns the slack.
    simdjson::padded_string padded(text);

    od::document document;
    if (auto error = parser.iterate(padded).get(document); error) {
        return fail(error);
    }

    Converter converter(max_depth);
    auto converted = converter.convert(document, 0);
    if (converted.has_value() == false) {
        return converted;
    }
    if (document.at_end() == false) {
        return tl::unexpected(WireJsonError{"trailing content after JSON document"});
    }
    return converted;
}

std::string wire_json_backend() {
    return std::string(simdjson::get_active_implementation()->name());
}

}  // namespace mcpchat
