#pragma once
#include <memory>
#include <string_view>

#include "../extra_fields.hpp"
#include "formatter_interface.hpp"

namespace ecs_logger {

// Renders one record as a compact ECS JSON object:
//   {"@timestamp":..,"log.level":..,"message":..,"ecs.version":..,"log.origin":{..},<extra fields>}
// Valid UTF-8 is written as-is; only '"', '\\' and control characters are escaped.
// Each ill-formed UTF-8 sequence becomes U+FFFD, so every line stays valid JSON.
class EcsFormatter : public IFormatter {
public:
    EcsFormatter() = default;
    explicit EcsFormatter(std::shared_ptr<const ExtraFieldsStore> extra_fields);

    size_t Format(const LogRecord& record, std::string& out) const override;

    static void AppendEscaped(std::string_view src, std::string& out);

private:
    std::shared_ptr<const ExtraFieldsStore> extra_fields_;
};

} // namespace ecs_logger
