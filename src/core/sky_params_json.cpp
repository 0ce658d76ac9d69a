#include "aurora/core/sky_params_json.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>
#include <utility>

#include "aurora/util/file_io.h"
#include "aurora/util/log.h"

namespace aurora {

namespace {

using json::Array;
using json::Object;
using json::Value;

// Field lists. The same function drives both directions so reading and
// writing can never disagree on a key name.
template <class V> void visit(V& v, LayerToggles& p);
template <class V> void visit(V& v, StarLayerParams& p);
template <class V> void visit(V& v, StarPalette& p);
template <class V> void visit(V& v, StarFieldParams& p);
template <class V> void visit(V& v, NebulaParams& p);
template <class V> void visit(V& v, CometParams& p);
template <class V> void visit(V& v, ShootingStarParams& p);
template <class V> void visit(V& v, AuroraBandParams& p);
template <class V> void visit(V& v, AuroraExtrasParams& p);
template <class V> void visit(V& v, AuroraParams& p);
template <class V> void visit(V& v, CompositeParams& p);
template <class V> void visit(V& v, SkyParams& p);

Value vec2_to_json(const Vec2& v) { return Array{static_cast<double>(v.x), static_cast<double>(v.y)}; }

Value vec3_to_json(const Vec3& v) {
  return Array{static_cast<double>(v.x), static_cast<double>(v.y), static_cast<double>(v.z)};
}

class JsonWriter {
 public:
  void field(const char* name, float& v) { out_[name] = static_cast<double>(v); }
  void field(const char* name, int& v) { out_[name] = static_cast<double>(v); }
  void field(const char* name, bool& v) { out_[name] = v; }
  void field(const char* name, Vec2& v) { out_[name] = vec2_to_json(v); }
  void field(const char* name, Vec3& v) { out_[name] = vec3_to_json(v); }

  template <std::size_t N>
  void field(const char* name, std::array<Vec3, N>& arr) {
    Array a;
    for (const Vec3& e : arr) a.push_back(vec3_to_json(e));
    out_[name] = std::move(a);
  }

  template <class T, std::size_t N>
  void field(const char* name, std::array<T, N>& arr) {
    counted(name, arr, static_cast<int>(N));
  }

  template <class T>
  void field(const char* name, T& nested) {
    JsonWriter w;
    visit(w, nested);
    out_[name] = w.take();
  }

  // Only the first `count` elements are written.
  template <class T, std::size_t N>
  void counted(const char* name, std::array<T, N>& arr, int count) {
    Array a;
    const std::size_t n = static_cast<std::size_t>(std::max(0, std::min(count, static_cast<int>(N))));
    for (std::size_t i = 0; i < n; ++i) {
      JsonWriter w;
      visit(w, arr[i]);
      a.push_back(w.take());
    }
    out_[name] = std::move(a);
  }

  Object take() { return std::move(out_); }

 private:
  Object out_;
};

class JsonReader {
 public:
  JsonReader(const Value& v, std::string path, std::vector<std::string>& unknown)
      : path_(std::move(path)), unknown_(unknown) {
    if (!v.is_object()) {
      const std::string what = path_.empty() ? "document" : path_.substr(0, path_.size() - 1);
      throw std::runtime_error("Sky config: " + what + " must be an object");
    }
    obj_ = &v.object();
  }

  void field(const char* name, float& v) {
    if (const Value* j = take(name)) v = to_float(number(*j, name), name);
  }

  void field(const char* name, int& v) {
    if (const Value* j = take(name)) {
      const double d = number(*j, name);
      if (d != std::floor(d) || std::fabs(d) > 1.0e9) fail(name, "must be an integer");
      v = static_cast<int>(d);
    }
  }

  void field(const char* name, bool& v) {
    if (const Value* j = take(name)) {
      if (!j->is_bool()) fail(name, "must be true or false");
      v = *j->as_bool();
    }
  }

  void field(const char* name, Vec2& v) {
    if (const Value* j = take(name)) {
      const Array& a = numbers(*j, name, 2);
      v = Vec2(to_float(*a[0].as_number(), name), to_float(*a[1].as_number(), name));
    }
  }

  void field(const char* name, Vec3& v) {
    if (const Value* j = take(name)) v = vec3(*j, name);
  }

  template <std::size_t N>
  void field(const char* name, std::array<Vec3, N>& arr) {
    const Value* j = take(name);
    if (!j) return;
    if (!j->is_array() || j->array().size() != N) fail(name, "must be an array of " + std::to_string(N) + " colours");
    for (std::size_t i = 0; i < N; ++i) arr[i] = vec3(j->array()[i], std::string(name) + "[" + std::to_string(i) + "]");
  }

  // Fixed-size lists may be shorter than N; missing entries keep their defaults.
  template <class T, std::size_t N>
  void field(const char* name, std::array<T, N>& arr) {
    int n = static_cast<int>(N);
    read_list(name, arr, n);
  }

  template <class T>
  void field(const char* name, T& nested) {
    if (const Value* j = take(name)) {
      JsonReader r(*j, path_ + name + ".", unknown_);
      visit(r, nested);
      r.finish();
    }
  }

  // The list length becomes `count`.
  template <class T, std::size_t N>
  void counted(const char* name, std::array<T, N>& arr, int& count) {
    read_list(name, arr, count);
  }

  // Reports every key that no field() call asked for.
  void finish() {
    for (const auto& kv : *obj_) {
      if (seen_.find(kv.first) == seen_.end()) unknown_.push_back(path_ + kv.first);
    }
  }

 private:
  const Value* take(const char* name) {
    seen_.insert(name);
    const auto it = obj_->find(name);
    return it == obj_->end() ? nullptr : &it->second;
  }

  template <class T, std::size_t N>
  bool read_list(const char* name, std::array<T, N>& arr, int& count) {
    const Value* j = take(name);
    if (!j) return false;
    if (!j->is_array()) fail(name, "must be an array");
    const Array& a = j->array();
    if (a.size() > N) fail(name, "has " + std::to_string(a.size()) + " entries (max " + std::to_string(N) + ")");
    for (std::size_t i = 0; i < a.size(); ++i) {
      JsonReader r(a[i], path_ + name + "[" + std::to_string(i) + "].", unknown_);
      visit(r, arr[i]);
      r.finish();
    }
    count = static_cast<int>(a.size());
    return true;
  }

  double number(const Value& j, const std::string& name) const {
    if (!j.is_number()) fail(name, "must be a number");
    return *j.as_number();
  }

  // Rejects magnitudes outside the float range.
  float to_float(double d, const std::string& name) const {
    if (std::fabs(d) > static_cast<double>(std::numeric_limits<float>::max())) fail(name, "must fit in a float");
    return static_cast<float>(d);
  }

  const Array& numbers(const Value& j, const std::string& name, std::size_t n) const {
    if (!j.is_array() || j.array().size() != n) fail(name, "must be an array of " + std::to_string(n) + " numbers");
    for (const Value& e : j.array()) {
      if (!e.is_number()) fail(name, "must be an array of " + std::to_string(n) + " numbers");
    }
    return j.array();
  }

  Vec3 vec3(const Value& j, const std::string& name) const {
    const Array& a = numbers(j, name, 3);
    return Vec3(to_float(*a[0].as_number(), name), to_float(*a[1].as_number(), name),
                to_float(*a[2].as_number(), name));
  }

  [[noreturn]] void fail(const std::string& name, const std::string& problem) const {
    throw std::runtime_error("Sky config: " + path_ + name + " " + problem);
  }

  const Object* obj_{nullptr};
  std::string path_;
  std::vector<std::string>& unknown_;
  std::set<std::string> seen_;
};

template <class V>
void visit(V& v, LayerToggles& p) {
  v.field("nebula", p.nebula);
  v.field("dust", p.dust);
  v.field("shooting_stars", p.shooting_stars);
  v.field("aurora", p.aurora);
}

template <class V>
void visit(V& v, StarLayerParams& p) {
  v.field("grid_scale", p.grid_scale);
  v.field("threshold", p.threshold);
  v.field("seed_offset", p.seed_offset);
  v.field("jitter", p.jitter);
  v.field("size_min", p.size_min);
  v.field("size_max", p.size_max);
  v.field("brightness", p.brightness);
  v.field("halo", p.halo);
  v.field("twinkle_amount", p.twinkle_amount);
  v.field("twinkle_speed", p.twinkle_speed);
}

template <class V>
void visit(V& v, StarPalette& p) {
  v.field("warm", p.warm);
  v.field("yellow", p.yellow);
  v.field("white", p.white);
  v.field("blue_white", p.blue_white);
  v.field("warm_fraction", p.warm_fraction);
  v.field("blue_fraction", p.blue_fraction);
}

template <class V>
void visit(V& v, StarFieldParams& p) {
  v.field("layers", p.layers);
  v.field("palette", p.palette);
  v.field("dust_scale", p.dust_scale);
  v.field("dust_threshold", p.dust_threshold);
  v.field("dust_strength", p.dust_strength);
  v.field("dust_drift", p.dust_drift);
  v.field("dust_tint", p.dust_tint);
}

template <class V>
void visit(V& v, NebulaParams& p) {
  v.field("scale", p.scale);
  v.field("drift", p.drift);
  v.field("octaves", p.octaves);
  v.field("hue_scale", p.hue_scale);
  v.field("mask_scale", p.mask_scale);
  v.field("mask_lo", p.mask_lo);
  v.field("mask_hi", p.mask_hi);
  v.field("color_a", p.color_a);
  v.field("color_b", p.color_b);
  v.field("strength", p.strength);
}

template <class V>
void visit(V& v, CometParams& p) {
  v.field("trigger_rate", p.trigger_rate);
  v.field("trigger_phase", p.trigger_phase);
  v.field("trigger_threshold", p.trigger_threshold);
  v.field("rate", p.rate);
  v.field("start", p.start);
  v.field("angle", p.angle);
  v.field("travel", p.travel);
  v.field("length", p.length);
  v.field("width", p.width);
  v.field("color", p.color);
  v.field("brightness", p.brightness);
}

template <class V>
void visit(V& v, ShootingStarParams& p) {
  v.counted("comets", p.comets, p.count);
}

template <class V>
void visit(V& v, AuroraBandParams& p) {
  v.field("enabled", p.enabled);
  v.field("strength", p.strength);
  v.field("noise_scale", p.noise_scale);
  v.field("noise_offset", p.noise_offset);
  v.field("scroll_speed", p.scroll_speed);
  v.field("octaves", p.octaves);
  v.field("wave_freq", p.wave_freq);
  v.field("wave_amp", p.wave_amp);
  v.field("wave_speed", p.wave_speed);
  v.field("flow_freq", p.flow_freq);
  v.field("flow_speed", p.flow_speed);
  v.field("center_y", p.center_y);
  v.field("height_falloff", p.height_falloff);
  v.field("noise_lo", p.noise_lo);
  v.field("noise_hi", p.noise_hi);
  v.field("detail_scale", p.detail_scale);
  v.field("detail_speed", p.detail_speed);
  v.field("detail_strength", p.detail_strength);
  v.field("anchors", p.anchors);
  v.field("blend_speed1", p.blend_speed1);
  v.field("blend_speed2", p.blend_speed2);
  v.field("blend_phase", p.blend_phase);
  v.field("dist_range", p.dist_range);
  v.field("glow_dark", p.glow_dark);
  v.field("glow_strength", p.glow_strength);
  v.field("ray_phase", p.ray_phase);
}

template <class V>
void visit(V& v, AuroraExtrasParams& p) {
  v.field("fine_detail", p.fine_detail);
  v.field("fine_scale", p.fine_scale);
  v.field("fine_strength", p.fine_strength);
  v.field("cross_detail", p.cross_detail);
  v.field("cross_freq", p.cross_freq);
  v.field("cross_speed", p.cross_speed);
  v.field("cross_strength", p.cross_strength);
  v.field("wisps", p.wisps);
  v.field("wisp_scale", p.wisp_scale);
  v.field("wisp_strength", p.wisp_strength);
  v.field("surges", p.surges);
  v.field("surge_rate", p.surge_rate);
  v.field("surge_threshold", p.surge_threshold);
  v.field("surge_boost", p.surge_boost);
  v.field("curtain_rays", p.curtain_rays);
  v.field("ray_rate", p.ray_rate);
  v.field("ray_phase", p.ray_phase);
  v.field("ray_threshold", p.ray_threshold);
  v.field("ray_density", p.ray_density);
  v.field("ray_strength", p.ray_strength);
}

template <class V>
void visit(V& v, AuroraParams& p) {
  v.field("primary", p.primary);
  v.field("secondary", p.secondary);
  v.field("extras", p.extras);
}

template <class V>
void visit(V& v, CompositeParams& p) {
  v.field("sky_top", p.sky_top);
  v.field("sky_bottom", p.sky_bottom);
  v.field("vignette_strength", p.vignette_strength);
  v.field("vignette_inner", p.vignette_inner);
  v.field("vignette_outer", p.vignette_outer);
  v.field("aurora_gain", p.aurora_gain);
  v.field("blend_cap", p.blend_cap);
  v.field("star_reinject", p.star_reinject);
}

template <class V>
void visit(V& v, SkyParams& p) {
  v.field("time_scale", p.time_scale);
  v.field("warmup_time", p.warmup_time);
  v.field("layers", p.layers);
  v.field("stars", p.stars);
  v.field("nebula", p.nebula);
  v.field("shooting_stars", p.shooting_stars);
  v.field("aurora", p.aurora);
  v.field("composite", p.composite);
}

} // namespace

json::Value sky_params_to_json(const SkyParams& p) {
  SkyParams copy = p;
  JsonWriter w;
  int version = kSkyParamsVersion;
  w.field("version", version);
  visit(w, copy);
  return w.take();
}

SkyParams sky_params_from_json(const json::Value& v, std::vector<std::string>* unknown_keys) {
  std::vector<std::string> unknown;
  SkyParams p;

  JsonReader r(v, "", unknown);
  int version = kSkyParamsVersion;
  r.field("version", version);
  if (version > kSkyParamsVersion) {
    log::warn("Sky config version " + std::to_string(version) + " is newer than supported (" +
              std::to_string(kSkyParamsVersion) + "); loading what is understood");
  }
  visit(r, p);
  r.finish();

  if (unknown_keys) {
    unknown_keys->insert(unknown_keys->end(), unknown.begin(), unknown.end());
  } else {
    for (const auto& k : unknown) log::warn("Sky config: ignoring unknown key '" + k + "'");
  }
  return p;
}

std::string serialize_sky_params(const SkyParams& p) { return json::stringify(sky_params_to_json(p), 2) + "\n"; }

SkyParams deserialize_sky_params(const std::string& json_text) {
  return sky_params_from_json(json::parse(json_text));
}

SkyParams load_sky_params_from_file(const std::string& path) {
  SkyParams p;
  try {
    p = deserialize_sky_params(read_text_file(path));
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load sky config '" + path + "': " + e.what());
  }
  log::info("Loaded sky config: " + path);
  return p;
}

void save_sky_params_to_file(const std::string& path, const SkyParams& p) {
  write_text_file(path, serialize_sky_params(p));
  log::info("Saved sky config: " + path);
}

} // namespace aurora
