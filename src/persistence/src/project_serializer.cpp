#include "persistence/project_serializer.hpp"
#include "persistence/json.hpp"
#include "core/log.hpp"
#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <fstream>
#include <sstream>

namespace nle::persistence {

using json::Value;

namespace {

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// Thrown inside parse_project only; converted to a LoadResult before returning
struct FormatError {
    std::string message;
};

[[noreturn]] void bad(const std::string& msg) { throw FormatError{msg}; }

// ---- writing ---------------------------------------------------------------

Value write_metadata(const timeline::AssetMetadata& m) {
    Value o = Value::object();
    if(m.width) o.set("width", Value::number(*m.width));
    if(m.height) o.set("height", Value::number(*m.height));
    if(m.aspect_ratio) o.set("aspectRatio", Value::string(*m.aspect_ratio));
    if(!m.thumbnails.empty()) {
        Value arr = Value::array();
        for(const auto& t : m.thumbnails) arr.push(Value::string(t));
        o.set("thumbnails", std::move(arr));
    }
    if(!m.waveform.empty()) {
        Value arr = Value::array();
        for(float w : m.waveform) arr.push(Value::number(w));
        o.set("waveform", std::move(arr));
    }
    for(const auto& [k, v] : m.extra) o.set(k, Value::string(v));
    return o;
}

Value write_asset(const timeline::Asset& a) {
    Value o = Value::object();
    o.set("id", Value::string(a.id));
    o.set("url", Value::string(a.url));
    o.set("type", Value::string(timeline::to_string(a.kind)));
    if(a.duration) o.set("duration", Value::number(*a.duration));
    Value meta = write_metadata(a.metadata);
    if(!meta.members().empty()) o.set("metadata", std::move(meta));
    o.set("createdAt", Value::number(static_cast<double>(a.created_at)));
    return o;
}

Value write_clip(const timeline::Clip& c) {
    Value o = Value::object();
    o.set("id", Value::string(c.id));
    if(c.asset_id) o.set("assetId", Value::string(*c.asset_id));
    o.set("trackId", Value::string(c.track_id));
    o.set("start", Value::number(c.start));
    o.set("end", Value::number(c.end));
    o.set("inPoint", Value::number(c.in_point));
    o.set("outPoint", Value::number(c.out_point));
    if(c.caption) {
        const auto& cap = *c.caption;
        o.set("type", Value::string("caption"));
        o.set("text", Value::string(cap.text));
        o.set("x", Value::number(cap.x));
        o.set("y", Value::number(cap.y));
        o.set("fontSize", Value::number(cap.font_size));
        o.set("align", Value::string(timeline::to_string(cap.align)));
        o.set("color", Value::string(cap.color));
        o.set("bg", Value::string(cap.background));
        o.set("opacity", Value::number(cap.opacity));
        o.set("fadeInMs", Value::number(cap.fade_in_ms));
        o.set("fadeOutMs", Value::number(cap.fade_out_ms));
    }
    if(c.transition) {
        o.set("transitionType", Value::string(timeline::to_string(c.transition->type)));
        o.set("transitionDuration", Value::number(c.transition->duration));
        o.set("transitionToClipId", Value::string(c.transition->to_clip_id));
    }
    return o;
}

Value write_track(const timeline::Track& t) {
    Value o = Value::object();
    o.set("id", Value::string(t.id));
    o.set("type", Value::string(timeline::to_string(t.kind)));
    Value clips = Value::array();
    for(const auto& c : t.clips) clips.push(write_clip(c));
    o.set("clips", std::move(clips));
    if(t.locked) o.set("locked", Value::boolean(true));
    if(t.muted) o.set("muted", Value::boolean(true));
    return o;
}

// ---- reading ---------------------------------------------------------------

const Value& require(const Value& obj, const char* key, const std::string& where) {
    const Value* v = obj.find(key);
    if(!v || v->is_null()) bad(where + ": missing " + key);
    return *v;
}

std::string req_string(const Value& obj, const char* key, const std::string& where) {
    const Value& v = require(obj, key, where);
    if(!v.is_string()) bad(where + ": " + key + " must be a string");
    return v.as_string();
}

double req_number(const Value& obj, const char* key, const std::string& where) {
    const Value& v = require(obj, key, where);
    if(!v.is_number()) bad(where + ": " + key + " must be a number");
    return v.as_number();
}

std::optional<std::string> opt_string(const Value& obj, const char* key) {
    const Value* v = obj.find(key);
    if(v && v->is_string()) return v->as_string();
    return std::nullopt;
}

std::optional<double> opt_number(const Value& obj, const char* key) {
    const Value* v = obj.find(key);
    if(v && v->is_number()) return v->as_number();
    return std::nullopt;
}

// Millisecond timestamps; anything non-finite or outside int64 reads as 0
int64_t opt_timestamp(const Value& obj, const char* key, const std::string& where) {
    auto v = opt_number(obj, key);
    if(!v) return 0;
    // 2^63 is exactly representable; the int64 range is [-2^63, 2^63)
    constexpr double limit = 9223372036854775808.0;
    if(!std::isfinite(*v) || *v < -limit || *v >= limit) {
        nle::log::warn("Project load: " + where + " has an out of range " + key + ", using 0");
        return 0;
    }
    return static_cast<int64_t>(*v);
}

bool opt_bool(const Value& obj, const char* key) {
    const Value* v = obj.find(key);
    return v && v->is_bool() && v->as_bool();
}

timeline::AssetMetadata read_metadata(const Value& o) {
    timeline::AssetMetadata m;
    for(const auto& member : o.members()) {
        const Value& v = member.value;
        if(member.key == "width" && v.is_number()) m.width = static_cast<int>(v.as_number());
        else if(member.key == "height" && v.is_number()) m.height = static_cast<int>(v.as_number());
        else if(member.key == "aspectRatio" && v.is_string()) m.aspect_ratio = v.as_string();
        else if(member.key == "thumbnails" && v.is_array()) {
            for(const auto& t : v.items()) if(t.is_string()) m.thumbnails.push_back(t.as_string());
        } else if(member.key == "waveform" && v.is_array()) {
            for(const auto& w : v.items()) if(w.is_number()) m.waveform.push_back(static_cast<float>(w.as_number()));
        } else if(v.is_string()) {
            m.extra[member.key] = v.as_string();
        } else if(!v.is_null()) {
            m.extra[member.key] = json::write(v, 0);
        }
    }
    return m;
}

timeline::Asset read_asset(const Value& o, size_t index) {
    std::string where = "assets[" + std::to_string(index) + "]";
    if(!o.is_object()) bad(where + ": expected an object");
    timeline::Asset a;
    a.id = req_string(o, "id", where);
    a.url = req_string(o, "url", where);
    std::string kind = req_string(o, "type", where);
    if(!timeline::parse_asset_kind(kind, a.kind)) bad(where + ": unknown asset type '" + kind + "'");
    a.duration = opt_number(o, "duration");
    a.created_at = opt_timestamp(o, "createdAt", where);
    if(const Value* meta = o.find("metadata"); meta && meta->is_object()) a.metadata = read_metadata(*meta);
    return a;
}

timeline::Clip read_clip(const Value& o, const std::string& where, const timeline::TrackId& track_id) {
    if(!o.is_object()) bad(where + ": expected an object");
    timeline::Clip c;
    c.id = req_string(o, "id", where);
    c.asset_id = opt_string(o, "assetId");
    c.track_id = opt_string(o, "trackId").value_or(track_id);
    if(c.track_id != track_id) {
        nle::log::warn("Project load: clip " + c.id + " claims track " + c.track_id + ", stored under " + track_id);
        c.track_id = track_id;
    }
    c.start = req_number(o, "start", where);
    c.end = req_number(o, "end", where);
    c.in_point = opt_number(o, "inPoint").value_or(0.0);
    c.out_point = opt_number(o, "outPoint").value_or(c.in_point + (c.end - c.start));

    if(opt_string(o, "type").value_or("") == "caption" || (!c.asset_id && o.find("text"))) {
        timeline::Caption cap;
        cap.text = opt_string(o, "text").value_or("");
        cap.x = opt_number(o, "x").value_or(cap.x);
        cap.y = opt_number(o, "y").value_or(cap.y);
        cap.font_size = opt_number(o, "fontSize").value_or(cap.font_size);
        if(auto align = opt_string(o, "align")) {
            if(!timeline::parse_text_align(*align, cap.align)) bad(where + ": unknown align '" + *align + "'");
        }
        cap.color = opt_string(o, "color").value_or(cap.color);
        cap.background = opt_string(o, "bg").value_or(cap.background);
        cap.opacity = opt_number(o, "opacity").value_or(cap.opacity);
        cap.fade_in_ms = opt_number(o, "fadeInMs").value_or(cap.fade_in_ms);
        cap.fade_out_ms = opt_number(o, "fadeOutMs").value_or(cap.fade_out_ms);
        c.caption = std::move(cap);
    }

    if(auto to = opt_string(o, "transitionToClipId")) {
        timeline::Transition tr;
        tr.to_clip_id = *to;
        tr.duration = opt_number(o, "transitionDuration").value_or(tr.duration);
        if(auto type = opt_string(o, "transitionType")) {
            if(!timeline::parse_transition_type(*type, tr.type)) bad(where + ": unknown transition type '" + *type + "'");
        }
        c.transition = std::move(tr);
    }
    return c;
}

timeline::Track read_track(const Value& o, size_t index) {
    std::string where = "tracks[" + std::to_string(index) + "]";
    if(!o.is_object()) bad(where + ": expected an object");
    timeline::Track t;
    t.id = req_string(o, "id", where);
    std::string kind = req_string(o, "type", where);
    if(!timeline::parse_track_kind(kind, t.kind)) bad(where + ": unknown track type '" + kind + "'");
    t.locked = opt_bool(o, "locked");
    t.muted = opt_bool(o, "muted");
    if(const Value* clips = o.find("clips")) {
        if(!clips->is_array()) bad(where + ": clips must be an array");
        for(size_t k = 0; k < clips->items().size(); ++k) {
            t.clips.push_back(read_clip(clips->items()[k], where + ".clips[" + std::to_string(k) + "]", t.id));
        }
    }
    timeline::sort_clips(t);
    return t;
}

ProjectDocument read_document(const Value& root) {
    if(!root.is_object()) bad("Invalid project file: expected a JSON object");
    ProjectDocument doc;

    const Value* version = root.find("version");
    if(!version || !version->is_string() || version->as_string().empty()) bad("Invalid project file: missing version");
    doc.version = version->as_string();
    std::string major = doc.version.substr(0, doc.version.find('.'));
    if(major != "1") bad("Unsupported project version " + doc.version);

    const Value* assets = root.find("assets");
    if(!assets || !assets->is_array()) bad("Invalid project file: missing or invalid assets");
    const Value* tracks = root.find("tracks");
    if(!tracks || !tracks->is_array()) bad("Invalid project file: missing or invalid tracks");
    const Value* aspect = root.find("aspectRatio");
    if(!aspect || !aspect->is_string() || aspect->as_string().empty()) bad("Invalid project file: missing aspectRatio");

    for(size_t k = 0; k < assets->items().size(); ++k) {
        timeline::Asset a = read_asset(assets->items()[k], k);
        if(doc.project.assets.count(a.id)) nle::log::warn("Project load: duplicate asset id " + a.id + ", keeping the last");
        doc.project.assets[a.id] = std::move(a);
    }
    for(size_t k = 0; k < tracks->items().size(); ++k) {
        doc.project.tracks.push_back(read_track(tracks->items()[k], k));
    }
    doc.project.aspect_ratio = aspect->as_string();
    doc.playhead = opt_number(root, "playhead");
    doc.zoom = opt_number(root, "zoom");
    doc.saved_at = opt_timestamp(root, "savedAt", "project");

    auto report = timeline::validate_project(doc.project);
    for(const auto& p : report.problems) nle::log::warn("Project load: " + p);
    return doc;
}

} // namespace

std::string serialize_project(const ProjectDocument& doc) {
    Value root = Value::object();
    root.set("version", Value::string(PROJECT_VERSION));
    Value assets = Value::array();
    for(const auto& [id, asset] : doc.project.assets) assets.push(write_asset(asset));
    root.set("assets", std::move(assets));
    Value tracks = Value::array();
    for(const auto& t : doc.project.tracks) tracks.push(write_track(t));
    root.set("tracks", std::move(tracks));
    root.set("aspectRatio", Value::string(doc.project.aspect_ratio));
    if(doc.playhead) root.set("playhead", Value::number(*doc.playhead));
    if(doc.zoom) root.set("zoom", Value::number(*doc.zoom));
    root.set("savedAt", Value::number(static_cast<double>(doc.saved_at ? doc.saved_at : now_ms())));
    return json::write(root, 2);
}

LoadResult parse_project(const std::string& text, ProjectDocument& out) noexcept {
    try {
        Value root;
        json::ParseError perr;
        if(!json::parse(text, root, perr)) {
            return {false, "Invalid JSON format: " + perr.message + " at offset " + std::to_string(perr.offset)};
        }
        out = read_document(root);
        return {true, {}};
    } catch(const FormatError& e) {
        return {false, e.message};
    } catch(const std::exception& e) {
        return {false, e.what()};
    }
}

SaveResult save_project_json(const ProjectDocument& doc, const std::string& path) noexcept {
    try {
        std::string text = serialize_project(doc);
        std::ofstream ofs(path, std::ios::binary);
        if(!ofs) return {false, "Failed to open file for writing"};
        ofs << text;
        if(!ofs) return {false, "Failed to write project file"};
        nle::log::info("Saved project to " + path);
        return {true, {}};
    } catch(const std::exception& e) {
        return {false, e.what()};
    }
}

LoadResult load_project_json(const std::string& path, ProjectDocument& out) noexcept {
    std::string txt;
    try {
        std::ifstream ifs(path, std::ios::binary);
        if(!ifs) return {false, "Failed to open file"};
        std::stringstream buf; buf << ifs.rdbuf();
        txt = buf.str();
    } catch(const std::exception& e) {
        return {false, e.what()};
    }
    LoadResult r = parse_project(txt, out);
    if(r.success) nle::log::info("Loaded project " + path);
    else nle::log::warn("Failed to load project " + path + ": " + r.error);
    return r;
}

} // namespace nle::persistence
