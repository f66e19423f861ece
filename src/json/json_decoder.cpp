#include "ibcp/json/json_decoder.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace ibcp {

namespace {

tl::unexpected<JsonDecodeError> failure(simdjson::error_code code) {
    return tl::unexpected(JsonDecodeError{std::string(simdjson::error_message(code))});
}

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

}  // namespace

JsonDecodeResult JsonDecoder::decode(std::string_view text) {
    const simdjson::padded_string padded(text);

    simdjson::ondemand::document document;
    auto error = parser_.iterate(padded).get(document);
    if (error) {
        return failure(error);
    }

    try {
        // Scalars at the root are not values in the on-demand API
        bool scalar_root = false;
        error = document.is_scalar().get(scalar_root);
        if (error) {
            return failure(error);
        }

        if (scalar_root) {
            simdjson::ondemand::json_type type;
            error = document.type().get(type);
            if (error) {
                return failure(error);
            }
            Json scalar;
            switch (type) {
                case simdjson::ondemand::json_type::string: {
                    std::string_view s;
                    error = document.get_string().get(s);
                    scalar = std::string(s);
                    break;
                }
                case simdjson::ondemand::json_type::boolean: {
                    bool b = false;
                    error = document.get_bool().get(b);
                    scalar = b;
                    break;
                }
                case simdjson::ondemand::json_type::null: {
                    bool is_null = false;
                    error = document.is_null().get(is_null);
                    scalar = nullptr;
                    break;
                }
                default: {
                    simdjson::ondemand::number_type kind;
                    error = document.get_number_type().get(kind);
                    if (error) {
                        break;
                    }
                    if (kind == simdjson::ondemand::number_type::signed_integer) {
                        std::int64_t i = 0;
                        error = document.get_int64().get(i);
                        scalar = i;
                    } else {
                        double d = 0.0;
                        error = document.get_double().get(d);
                        scalar = d;
                    }
                    break;
                }
            }
            if (error) {
                return failure(error);
            }
            if (document.at_end() == false) {
                return tl::unexpected(JsonDecodeError{"Trailing content after JSON value"});
            }
            return scalar;
        }

        simdjson::ondemand::value root;
        error = document.get_value().get(root);
        if (error) {
            return failure(error);
        }
        auto converted = to_json(root, 0);
        if (converted.has_value() && document.at_end() == false) {
            return tl::unexpected(JsonDecodeError{"Trailing content after JSON value"});
        }
        return converted;
    } catch (const simdjson::simdjson_error& e) {
        return tl::unexpected(JsonDecodeError{e.what()});
    }
}

JsonDecodeResult JsonDecoder::to_json(simdjson::ondemand::value value, std::size_t depth) {
    if (depth > max_depth_) {
        return tl::unexpected(JsonDecodeError{
            "JSON nesting deeper than " + std::to_string(max_depth_)
        });
    }

    simdjson::ondemand::json_type type;
    auto error = value.type().get(type);
    if (error) {
        return failure(error);
    }

    switch (type) {
        case simdjson::ondemand::json_type::object: {
            simdjson::ondemand::object object;
            error = value.get_object().get(object);
            if (error) {
                return failure(error);
            }
            Json out = Json::object();
            for (auto field : object) {
                std::string_view key;
                error = field.unescaped_key().get(key);
                if (error) {
                    return failure(error);
                }
                simdjson::ondemand::value member;
                error = field.value().get(member);
                if (error) {
                    return failure(error);
                }
                auto child = to_json(member, depth + 1);
                if (child.has_value() == false) {
                    return child;
                }
                out[std::string(key)] = std::move(*child);
            }
            return out;
        }

        case simdjson::ondemand::json_type::array: {
            simdjson::ondemand::array array;
            error = value.get_array().get(array);
            if (error) {
                return failure(error);
            }
            Json out = Json::array();
            for (auto element : array) {
                simdjson::ondemand::value item;
                error = element.get(item);
                if (error) {
                    return failure(error);
                }
                auto child = to_json(item, depth + 1);
                if (child.has_value() == false) {
                    return child;
                }
                out.push_back(std::move(*child));
            }
            return out;
        }

        case simdjson::ondemand::json_type::string: {
            std::string_view s;
            error = value.get_string().get(s);
            if (error) {
                return failure(error);
            }
            return Json(std::string(s));
        }

        case simdjson::ondemand::json_type::number: {
            // Gateway ids (conid, order ids) are integers; prices are doubles
            simdjson::ondemand::number_type kind;
            error = value.get_number_type().get(kind);
            if (error) {
                return failure(error);
            }
            if (kind == simdjson::ondemand::number_type::signed_integer) {
                std::int64_t i = 0;
                error = value.get_int64().get(i);
                if (error) {
                    return failure(error);
                }
                return Json(i);
            }
            if (kind == simdjson::ondemand::number_type::unsigned_integer) {
                std::uint64_t u = 0;
                error = value.get_uint64().get(u);
                if (error) {
                    return failure(error);
                }
                return Json(u);
            }
            double d = 0.0;
            error = value.get_double().get(d);
            if (error) {
                return failure(error);
            }
            return Json(d);
        }

        case simdjson::ondemand::json_type::boolean: {
            bool b = false;
            error = value.get_bool().get(b);
            if (error) {
                return failure(error);
            }
            return Json(b);
        }

        case simdjson::ondemand::json_type::null:
            return Json(nullptr);
    }

    return tl::unexpected(JsonDecodeError{"Unknown JSON type"});
}

JsonDecodeResult decode_response_body(std::string_view body) {
    if (is_blank(body)) {
        return Json::object();
    }
    thread_local JsonDecoder decoder;
    return decoder.decode(body);
}

}  // namespace ibcp
