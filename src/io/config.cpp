#include "lucky_stack/config/configuration.hpp"
#include "lucky_stack/core/errors.hpp"

#include <fstream>

namespace lucky_stack::config {

static void read_int_pair(const YAML::Node& n, std::array<int, 2>& out) {
    if (n && n.IsSequence() && n.size() == 2) {
        out[0] = n[0].as<int>();
        out[1] = n[1].as<int>();
    } else if (n && n.IsScalar()) {
        out[0] = n.as<int>();
        out[1] = out[0];
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["data"]) {
            auto d = node["data"];
            if (d["max_frames"]) cfg.data.max_frames = d["max_frames"].as<int>();
        }

        if (node["registration"]) {
            auto r = node["registration"];
            if (r["method"]) cfg.registration.method = r["method"].as<std::string>();
            if (r["subpixel"]) cfg.registration.subpixel = r["subpixel"].as<bool>();
            if (r["border_margin"]) cfg.registration.border_margin = r["border_margin"].as<int>();
            if (r["search_window"] && !r["search_window"].IsNull()) {
                auto w = r["search_window"];
                if (!w.IsSequence() || w.size() != 4) {
                    throw ConfigError("registration.search_window must be [x, y, width, height]");
                }
                cfg.registration.search_window =
                    std::array<int, 4>{w[0].as<int>(), w[1].as<int>(), w[2].as<int>(),
                                       w[3].as<int>()};
            }
        }

        if (node["selection"]) {
            auto s = node["selection"];
            if (s["fraction"]) cfg.selection.fraction = s["fraction"].as<double>();
        }

        if (node["execution"]) {
            auto e = node["execution"];
            if (e["mode"]) cfg.execution.mode = e["mode"].as<std::string>();
            if (e["workers"]) cfg.execution.workers = e["workers"].as<int>();
        }

        if (node["tiptilt"]) {
            auto t = node["tiptilt"];
            if (t["shifts"] && !t["shifts"].IsNull()) {
                auto s = t["shifts"];
                if (!s.IsSequence()) {
                    throw ConfigError("tiptilt.shifts must be a list of [dy, dx] pairs");
                }
                std::vector<std::array<float, 2>> shifts;
                for (const auto& pair : s) {
                    if (!pair.IsSequence() || pair.size() != 2) {
                        throw ConfigError("tiptilt.shifts entries must be [dy, dx]");
                    }
                    shifts.push_back({pair[0].as<float>(), pair[1].as<float>()});
                }
                cfg.tiptilt.shifts = std::move(shifts);
                cfg.tiptilt.sigma_px.reset();
            }
            if (t["sigma_px"]) {
                if (t["sigma_px"].IsNull()) {
                    cfg.tiptilt.sigma_px.reset();
                } else {
                    cfg.tiptilt.sigma_px = t["sigma_px"].as<float>();
                }
            }
            if (t["n_copies"]) cfg.tiptilt.n_copies = t["n_copies"].as<int>();
            read_int_pair(t["crop_px"], cfg.tiptilt.crop_px);
            if (t["seed"]) cfg.tiptilt.seed = t["seed"].as<uint64_t>();
        }

        if (node["synthetic"]) {
            auto s = node["synthetic"];
            if (s["rows"]) cfg.synthetic.rows = s["rows"].as<int>();
            if (s["cols"]) cfg.synthetic.cols = s["cols"].as<int>();
            if (s["sigma_px"]) cfg.synthetic.sigma_px = s["sigma_px"].as<float>();
            if (s["amplitude"]) cfg.synthetic.amplitude = s["amplitude"].as<float>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["stack_name"]) cfg.output.stack_name = o["stack_name"].as<std::string>();
            if (o["write_shifted_frames"]) {
                cfg.output.write_shifted_frames = o["write_shifted_frames"].as<bool>();
            }
            if (o["write_shifts"]) cfg.output.write_shifts = o["write_shifts"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid value: ") + e.what());
    }

    return cfg;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["data"]["max_frames"] = data.max_frames;

    node["registration"]["method"] = registration.method;
    node["registration"]["subpixel"] = registration.subpixel;
    node["registration"]["border_margin"] = registration.border_margin;
    if (registration.search_window) {
        for (int v : *registration.search_window) {
            node["registration"]["search_window"].push_back(v);
        }
    }

    node["selection"]["fraction"] = selection.fraction;

    node["execution"]["mode"] = execution.mode;
    node["execution"]["workers"] = execution.workers;

    if (tiptilt.sigma_px) {
        node["tiptilt"]["sigma_px"] = *tiptilt.sigma_px;
    } else {
        node["tiptilt"]["sigma_px"] = YAML::Node(YAML::NodeType::Null);
    }
    if (tiptilt.shifts) {
        YAML::Node shifts(YAML::NodeType::Sequence);
        for (const auto& s : *tiptilt.shifts) {
            YAML::Node pair;
            pair.push_back(s[0]);
            pair.push_back(s[1]);
            shifts.push_back(pair);
        }
        node["tiptilt"]["shifts"] = shifts;
    }
    node["tiptilt"]["n_copies"] = tiptilt.n_copies;
    node["tiptilt"]["crop_px"].push_back(tiptilt.crop_px[0]);
    node["tiptilt"]["crop_px"].push_back(tiptilt.crop_px[1]);
    node["tiptilt"]["seed"] = tiptilt.seed;

    node["synthetic"]["rows"] = synthetic.rows;
    node["synthetic"]["cols"] = synthetic.cols;
    node["synthetic"]["sigma_px"] = synthetic.sigma_px;
    node["synthetic"]["amplitude"] = synthetic.amplitude;

    node["output"]["stack_name"] = output.stack_name;
    node["output"]["write_shifted_frames"] = output.write_shifted_frames;
    node["output"]["write_shifts"] = output.write_shifts;

    return node;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

void Config::validate() const {
    if (data.max_frames < 0) {
        throw ConfigError("data.max_frames must be >= 0");
    }

    alignment_method();
    if (registration.border_margin < 0) {
        throw ConfigError("registration.border_margin must be >= 0");
    }
    if (registration.search_window) {
        const auto& w = *registration.search_window;
        if (w[0] < 0 || w[1] < 0 || w[2] <= 0 || w[3] <= 0) {
            throw ConfigError("registration.search_window must have x,y >= 0 and width,height > 0");
        }
    }

    if (!(selection.fraction > 0.0) || selection.fraction > 1.0) {
        throw ConfigError("selection.fraction must be in (0,1]");
    }

    execution_mode();
    if (execution.workers < 0) {
        throw ConfigError("execution.workers must be >= 0");
    }

    if (tiptilt.sigma_px && *tiptilt.sigma_px < 0.0f) {
        throw ConfigError("tiptilt.sigma_px must be >= 0");
    }
    if (tiptilt.sigma_px && tiptilt.shifts) {
        throw ConfigError("tiptilt.sigma_px and tiptilt.shifts are mutually exclusive");
    }
    if (tiptilt.n_copies < 1) {
        throw ConfigError("tiptilt.n_copies must be >= 1");
    }
    if (tiptilt.crop_px[0] < 0 || tiptilt.crop_px[1] < 0) {
        throw ConfigError("tiptilt.crop_px must be >= 0");
    }

    if (synthetic.rows < 1 || synthetic.cols < 1) {
        throw ConfigError("synthetic.rows and synthetic.cols must be >= 1");
    }
    if (synthetic.sigma_px <= 0.0f) {
        throw ConfigError("synthetic.sigma_px must be > 0");
    }

    if (output.stack_name.empty()) {
        throw ConfigError("output.stack_name must not be empty");
    }
}

AlignmentMethod Config::alignment_method() const {
    auto method = string_to_alignment_method(registration.method);
    if (!method) {
        throw ConfigError("registration.method must be 'xcorr', 'peak_pixel' or 'centroid', got '" +
                          registration.method + "'");
    }
    return *method;
}

ExecutionMode Config::execution_mode() const {
    auto mode = string_to_execution_mode(execution.mode);
    if (!mode) {
        throw ConfigError("execution.mode must be 'parallel' or 'serial', got '" +
                          execution.mode + "'");
    }
    return *mode;
}

pipeline::LuckyImagingOptions Config::lucky_imaging_options() const {
    pipeline::LuckyImagingOptions opts;
    opts.registration.method = alignment_method();
    opts.registration.subpixel = registration.subpixel;
    opts.registration.border_margin = registration.border_margin;
    if (registration.search_window) {
        const auto& w = *registration.search_window;
        opts.registration.search_window = SearchWindow{w[0], w[1], w[2], w[3]};
    }
    opts.selection_fraction = selection.fraction;
    opts.mode = execution_mode();
    opts.workers = execution.workers;
    opts.max_frames = data.max_frames;
    return opts;
}

synthetic::TipTiltOptions Config::tiptilt_options() const {
    synthetic::TipTiltOptions opts;
    opts.sigma_px = tiptilt.sigma_px;
    if (tiptilt.shifts) {
        std::vector<ShiftVector> shifts;
        shifts.reserve(tiptilt.shifts->size());
        for (const auto& s : *tiptilt.shifts) {
            shifts.push_back({s[0], s[1]});
        }
        opts.shifts = std::move(shifts);
    }
    opts.n_copies = tiptilt.n_copies;
    opts.crop_px = tiptilt.crop_px;
    opts.seed = tiptilt.seed;
    return opts;
}

} // namespace lucky_stack::config
