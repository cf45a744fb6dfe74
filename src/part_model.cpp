#include "part_model.h"
#include "utils.h"

namespace bommatch {

const std::string* find_property(const PropertyMap& props, const std::string& name) {
    auto it = props.find(name);
    if (it != props.end()) return &it->second;
    for (auto& [key, value] : props) {
        if (iequals(key, name)) return &value;
    }
    return nullptr;
}

static std::string property_or_empty(const PropertyMap& props, const std::string& name) {
    auto p = find_property(props, name);
    return p ? trim(*p) : std::string();
}

CategoryAttributes category_attributes(Category category, const PropertyMap& props) {
    switch (category) {
    case Category::Led: {
        LedAttributes a;
        a.wavelength = property_or_empty(props, "Wavelength");
        a.intensity  = property_or_empty(props, "mcd");
        a.angle      = property_or_empty(props, "Angle");
        return a;
    }
    case Category::Oscillator: {
        OscillatorAttributes a;
        a.frequency = property_or_empty(props, "Frequency");
        a.stability = property_or_empty(props, "Stability");
        a.load      = property_or_empty(props, "Load");
        return a;
    }
    case Category::Connector: {
        ConnectorAttributes a;
        a.pitch = property_or_empty(props, "Pitch");
        return a;
    }
    case Category::IntegratedCircuit:
    case Category::Microcontroller: {
        IcAttributes a;
        a.family = property_or_empty(props, "Family");
        return a;
    }
    default:
        return std::monostate{};
    }
}

std::vector<std::string> category_attribute_keys(Category category) {
    switch (category) {
    case Category::Led:               return {"Wavelength", "mcd", "Angle"};
    case Category::Oscillator:        return {"Frequency", "Stability", "Load"};
    case Category::Connector:         return {"Pitch"};
    case Category::IntegratedCircuit:
    case Category::Microcontroller:   return {"Family"};
    default:                          return {};
    }
}

} // namespace bommatch
