/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WRAPPERS_HPP
#define WRAPPERS_HPP

#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace MapForge {

/**
 * @brief Text parsing and formatting for the primitives behind map values
 *
 * parse() throws MapError(InvalidScalar) naming the wrapper being parsed.
 */
template <typename T> struct ScalarTraits;

template <> struct ScalarTraits<int32_t> {
  static int32_t parse(std::string_view text, const char *typeName);
  static std::string format(int32_t value) { return std::to_string(value); }
};

template <> struct ScalarTraits<uint8_t> {
  static uint8_t parse(std::string_view text, const char *typeName);
  static std::string format(uint8_t value) {
    return std::to_string(static_cast<unsigned>(value));
  }
};

template <> struct ScalarTraits<float> {
  static float parse(std::string_view text, const char *typeName);
  static std::string format(float value);
};

// Accepts yes/no and true/false, writes yes/no
template <> struct ScalarTraits<bool> {
  static bool parse(std::string_view text, const char *typeName);
  static std::string format(bool value) { return value ? "yes" : "no"; }
};

template <> struct ScalarTraits<std::string> {
  static std::string parse(std::string_view text, const char *) {
    return std::string(text);
  }
  static std::string format(const std::string &value) { return value; }
};

/**
 * @brief Distinct value type over a primitive
 *
 * Two instantiations with different tags never convert into each other, even
 * when they wrap the same primitive. Tag supplies the name used in errors.
 */
template <typename Tag, typename T> class StrongValue {
public:
  using ValueType = T;

  constexpr StrongValue() = default;
  constexpr explicit StrongValue(T value) : m_value(std::move(value)) {}

  constexpr const T &get() const noexcept { return m_value; }

  static StrongValue parse(std::string_view text) {
    return StrongValue(ScalarTraits<T>::parse(text, Tag::NAME));
  }

  std::string toString() const { return ScalarTraits<T>::format(m_value); }

  static constexpr const char *typeName() noexcept { return Tag::NAME; }

  friend bool operator==(const StrongValue &, const StrongValue &) = default;
  friend auto operator<=>(const StrongValue &, const StrongValue &) = default;

  friend std::ostream &operator<<(std::ostream &os, const StrongValue &value) {
    return os << Tag::NAME << '(' << value.toString() << ')';
  }

private:
  T m_value{};
};

#define MAPFORGE_STRONG_VALUE(Name, Primitive)                                 \
  struct Name##Tag {                                                           \
    static constexpr const char *NAME = #Name;                                 \
  };                                                                           \
  using Name = StrongValue<Name##Tag, Primitive>

// Provinces
MAPFORGE_STRONG_VALUE(ProvinceId, int32_t);
MAPFORGE_STRONG_VALUE(Red, uint8_t);
MAPFORGE_STRONG_VALUE(Green, uint8_t);
MAPFORGE_STRONG_VALUE(Blue, uint8_t);
MAPFORGE_STRONG_VALUE(Coastal, bool);
MAPFORGE_STRONG_VALUE(Terrain, std::string);
MAPFORGE_STRONG_VALUE(ContinentIndex, int32_t);
MAPFORGE_STRONG_VALUE(Continent, std::string);

// Adjacencies
MAPFORGE_STRONG_VALUE(XCoord, int32_t);
MAPFORGE_STRONG_VALUE(YCoord, int32_t);
MAPFORGE_STRONG_VALUE(AdjacencyRuleName, std::string);
MAPFORGE_STRONG_VALUE(TooltipKey, std::string);

// Strategic regions and weather
MAPFORGE_STRONG_VALUE(StrategicRegionId, int32_t);
MAPFORGE_STRONG_VALUE(StrategicRegionName, std::string);
MAPFORGE_STRONG_VALUE(Temperature, float);
MAPFORGE_STRONG_VALUE(Weight, float);
MAPFORGE_STRONG_VALUE(SnowLevel, float);

// Logistics
MAPFORGE_STRONG_VALUE(RailLevel, int32_t);
MAPFORGE_STRONG_VALUE(RailLength, int32_t);

// States and buildings
MAPFORGE_STRONG_VALUE(StateId, int32_t);
MAPFORGE_STRONG_VALUE(StateName, std::string);
MAPFORGE_STRONG_VALUE(StateCategoryName, std::string);
MAPFORGE_STRONG_VALUE(Manpower, int32_t);
MAPFORGE_STRONG_VALUE(CountryTag, std::string);
MAPFORGE_STRONG_VALUE(VictoryPoints, int32_t);
MAPFORGE_STRONG_VALUE(LocalSupplies, float);
MAPFORGE_STRONG_VALUE(BuildingsMaxLevelFactor, float);
MAPFORGE_STRONG_VALUE(BuildingId, std::string);

// Cities and props
MAPFORGE_STRONG_VALUE(ModelIndex, int32_t);
MAPFORGE_STRONG_VALUE(ColorIndex, int32_t);
MAPFORGE_STRONG_VALUE(PixelDensity, float);
MAPFORGE_STRONG_VALUE(PixelStep, int32_t);
MAPFORGE_STRONG_VALUE(Distance, float);
MAPFORGE_STRONG_VALUE(MeshId, std::string);

/**
 * @brief Hue/saturation/value triple used by the season tints
 */
struct Hsv {
  float hue{0.0f};
  float saturation{0.0f};
  float value{0.0f};

  bool operator==(const Hsv &) const = default;
};

inline std::ostream &operator<<(std::ostream &os, const Hsv &hsv) {
  return os << "Hsv(" << hsv.hue << ", " << hsv.saturation << ", "
            << hsv.value << ')';
}

} // namespace MapForge

// Hash function for std::unordered_map support
namespace std {
template <typename Tag, typename T> struct hash<MapForge::StrongValue<Tag, T>> {
  std::size_t
  operator()(const MapForge::StrongValue<Tag, T> &value) const noexcept {
    return std::hash<T>{}(value.get());
  }
};
} // namespace std

#endif // WRAPPERS_HPP
