/**
 * @file parameters.cpp
 * @brief Built-in parameter catalog
 */

#include <core/parameters.hpp>
#include <algorithm>
#include <cctype>

namespace MineSpec {

namespace {

ParameterSpec numeric(std::string name, std::string unit, Bounds bounds, double tol,
                      std::vector<std::string> aliases) {
    ParameterSpec p;
    p.name = std::move(name);
    p.kind = ParameterKind::Numeric;
    p.canonical_unit = std::move(unit);
    p.bounds = bounds;
    p.tolerance_pct = tol;
    p.aliases = std::move(aliases);
    return p;
}

ParameterSpec count(std::string name, Bounds bounds, std::vector<std::string> aliases,
                    std::vector<std::string> trailing) {
    ParameterSpec p;
    p.name = std::move(name);
    p.kind = ParameterKind::Count;
    p.bounds = bounds;
    p.tolerance_pct = 0.0;
    p.aliases = std::move(aliases);
    p.trailing_aliases = std::move(trailing);
    return p;
}

ParameterSpec text(std::string name, std::string pattern, std::vector<std::string> aliases) {
    ParameterSpec p;
    p.name = std::move(name);
    p.kind = ParameterKind::Text;
    p.text_pattern = std::move(pattern);
    p.tolerance_pct = 0.0;
    p.aliases = std::move(aliases);
    return p;
}

} // namespace

ParameterCatalog::ParameterCatalog() {
    // Weights and capacities
    params_.push_back(numeric("operating_weight_kg", "kg", {10000, 1500000}, 1.0,
        {"operating weight", "gross operating weight", "operating mass", "service weight",
         "gross vehicle weight", "gross machine weight", "weight", "peso operativo",
         "peso de operacion", "peso operacional", "einsatzgewicht", "betriebsgewicht",
         "poids en ordre de marche", "poids operationnel"}));
    params_.push_back(numeric("empty_weight_kg", "kg", {8000, 1200000}, 1.0,
        {"empty weight", "empty vehicle weight", "empty machine weight", "chassis weight",
         "tare weight", "peso vacio", "peso en vacio", "leergewicht", "poids a vide"}));
    params_.push_back(numeric("payload_capacity_kg", "kg", {20000, 500000}, 1.0,
        {"payload", "payload capacity", "rated payload", "nominal payload",
         "target payload", "capacidad de carga", "carga util", "nutzlast", "charge utile"}));
    params_.push_back(numeric("lifting_capacity_kg", "kg", {5000, 500000}, 1.0,
        {"lifting capacity", "lift capacity", "rated lift capacity", "capacidad de elevacion",
         "capacidad de levante", "hubkraft", "tragfahigkeit", "capacite de levage"}));

    // Engine
    params_.push_back(numeric("engine_power_kw", "kW", {37, 3728}, 2.0,
        {"engine power", "gross power", "net power", "rated power", "engine output",
         "flywheel power", "power rating", "horsepower", "power", "potencia del motor",
         "potencia bruta", "potencia neta", "potencia", "motorleistung", "leistung",
         "puissance moteur", "puissance"}));
    params_.push_back(text("engine_model",
        R"(^[\s:=\-]{0,6}([a-z0-9][a-z0-9\-/. ]{1,30}[a-z0-9]))",
        {"engine model", "engine make and model", "engine", "modelo del motor",
         "modelo de motor", "motor", "motortyp", "modele de moteur"}));
    params_.push_back(numeric("torque_nm", "Nm", {100, 30000}, 2.0,
        {"max torque", "maximum torque", "peak torque", "gross torque", "torque",
         "par motor", "par maximo", "drehmoment", "couple"}));
    params_.push_back(numeric("displacement_l", "L", {3, 120}, 2.0,
        {"displacement", "engine displacement", "cylinder capacity", "cilindrada",
         "hubraum", "cylindree"}));
    params_.push_back(count("cylinder_count", {2, 24},
        {"number of cylinders", "cylinders", "numero de cilindros", "cilindros",
         "zylinderzahl", "anzahl zylinder", "nombre de cylindres"},
        {"cylinders", "cylinder", "cilindros", "zylinder"}));
    params_.push_back(text("emission_standard",
        R"(((?:u\.?s\.?\s{0,2})?(?:epa\s{0,2})?tier\s{0,2}[1-4][a-z]?(?:\s{0,2}(?:final|interim))?|(?:eu\s{0,2})?stage\s{0,2}(?:iiia|iiib|iv|v|iii|ii|i)\b|euro\s{0,2}[1-6]))",
        {"emission standard", "emissions", "emission", "emissions rating", "norma de emisiones",
         "emisiones", "abgasnorm", "abgasstufe", "norme d'emission"}));

    // Volumes
    params_.push_back(numeric("bucket_capacity_m3", "m3", {1, 65}, 2.0,
        {"bucket capacity", "heaped bucket capacity", "rated bucket capacity", "bucket size",
         "capacidad del balde", "capacidad de balde", "capacidad del cucharon",
         "schaufelinhalt", "loffelinhalt", "capacite du godet"}));
    params_.push_back(numeric("dipper_capacity_m3", "m3", {1, 65}, 2.0,
        {"dipper capacity", "nominal dipper capacity", "dipper payload volume",
         "capacidad del cucharon de pala", "capacidad de cucharon"}));
    params_.push_back(numeric("fuel_tank_capacity_l", "L", {100, 10000}, 2.0,
        {"fuel tank capacity", "fuel tank", "fuel capacity", "capacidad del tanque",
         "tanque de combustible", "capacidad de combustible", "kraftstofftank",
         "tankinhalt", "reservoir de carburant"}));

    // Speeds
    params_.push_back(numeric("max_speed_kph", "km/h", {5, 80}, 2.0,
        {"maximum speed", "max speed", "top speed", "max travel speed", "travel speed",
         "maximum travel speed", "velocidad maxima", "hochstgeschwindigkeit",
         "vitesse maximale"}));
    params_.push_back(numeric("swing_speed_rpm", "rpm", {1, 15}, 2.0,
        {"swing speed", "max swing speed", "slew speed", "velocidad de giro",
         "schwenkgeschwindigkeit", "vitesse de rotation"}));

    // Dimensions
    params_.push_back(numeric("overall_width_m", "m", {2, 15}, 2.0,
        {"overall width", "width", "total width", "ancho total", "ancho",
         "gesamtbreite", "breite", "largeur hors tout", "largeur"}));
    params_.push_back(numeric("overall_length_m", "m", {3, 25}, 2.0,
        {"overall length", "length", "total length", "shipping length", "largo total",
         "longitud total", "gesamtlange", "lange", "longueur hors tout", "longueur"}));
    params_.push_back(numeric("overall_height_m", "m", {2, 15}, 2.0,
        {"overall height", "height", "total height", "height to top of cab", "altura total",
         "gesamthohe", "hohe", "hauteur hors tout", "hauteur"}));
    params_.push_back(numeric("dump_height_m", "m", {2, 25}, 2.0,
        {"dump height", "maximum dump height", "dump clearance", "dumping height",
         "altura de descarga", "altura de vaciado", "auskipphohe", "hauteur de deversement"}));
    params_.push_back(numeric("digging_depth_m", "m", {1, 25}, 2.0,
        {"digging depth", "max digging depth", "maximum digging depth", "dig depth",
         "profundidad de excavacion", "grabtiefe", "profondeur de fouille"}));
    params_.push_back(numeric("max_reach_m", "m", {3, 30}, 2.0,
        {"maximum reach", "max reach", "reach at ground level", "digging reach",
         "alcance maximo", "alcance", "reichweite", "portee maximale"}));
    params_.push_back(numeric("turning_radius_m", "m", {3, 30}, 2.0,
        {"turning radius", "turning circle", "min turning radius", "radio de giro",
         "wenderadius", "rayon de braquage"}));
    params_.push_back(numeric("track_shoe_width_mm", "mm", {300, 1500}, 2.0,
        {"track shoe width", "shoe width", "track pad width", "ancho de zapata",
         "ancho de la zapata", "bodenplattenbreite", "largeur des tuiles"}));

    // Forces and hydraulics
    params_.push_back(numeric("breakout_force_kn", "kN", {50, 3000}, 2.0,
        {"breakout force", "bucket breakout force", "digging force", "bucket digging force",
         "fuerza de excavacion", "fuerza de arranque", "ausbrechkraft", "reisskraft",
         "force d'arrachement"}));
    params_.push_back(numeric("hydraulic_pressure_bar", "bar", {100, 600}, 2.0,
        {"hydraulic pressure", "system pressure", "relief valve setting", "working pressure",
         "operating pressure", "presion hidraulica", "presion de trabajo", "systemdruck",
         "arbeitsdruck", "pression hydraulique"}));
    params_.push_back(numeric("hydraulic_flow_lpm", "L/min", {50, 5000}, 2.0,
        {"hydraulic flow", "pump flow", "max pump flow", "maximum oil flow", "oil flow",
         "caudal hidraulico", "caudal de la bomba", "pumpenforderstrom", "forderstrom",
         "debit hydraulique"}));
    params_.push_back(numeric("fuel_consumption_lph", "L/h", {10, 1000}, 2.0,
        {"fuel consumption", "fuel burn", "consumo de combustible", "consumo",
         "kraftstoffverbrauch", "consommation de carburant"}));
    params_.push_back(numeric("ground_pressure_kpa", "kPa", {20, 300}, 2.0,
        {"ground pressure", "ground bearing pressure", "presion sobre el suelo",
         "presion al suelo", "bodendruck", "pression au sol"}));
    params_.push_back(numeric("gradeability_pct", "%", {10, 70}, 2.0,
        {"gradeability", "max gradeability", "maximum grade", "climbing ability",
         "pendiente maxima", "steigfahigkeit", "pente maximale"}));

    // Drivetrain and undercarriage
    params_.push_back(text("transmission_type",
        R"((diesel[\s\-]{0,2}electric|electric\s{0,2}drive|ac\s{0,2}drive|dc\s{0,2}drive|powershift|power\s{0,2}shift|automatic|hydrostatic|mechanical|manual))",
        {"transmission type", "transmission", "drive system", "drive train", "tipo de transmision",
         "transmision", "getriebe", "antrieb", "boite de vitesses"}));
    params_.push_back(text("tire_size",
        R"((\d{2}(?:\.\d{1,2})?\s{0,2}(?:/\s{0,2}\d{2})?\s{0,2}r\s{0,2}\d{2}(?:\.\d)?|\d{2}\.\d{2}\s{0,2}-\s{0,2}\d{2}))",
        {"tire size", "tyre size", "tires", "tyres", "standard tires", "tamano de neumaticos",
         "neumaticos", "reifengrosse", "bereifung", "pneumatiques"}));
    params_.push_back(text("undercarriage_type",
        R"((crawler|tracked|track|wheeled|wheel|rubber[\s\-]{0,2}tired|walking))",
        {"undercarriage type", "undercarriage", "tipo de rodaje", "tren de rodaje", "tipo de rodamiento",
         "fahrwerk", "train de roulement"}));

    // Electrical and haulage
    params_.push_back(numeric("system_voltage_v", "V", {12, 1200}, 2.0,
        {"system voltage", "electrical system", "voltage", "voltaje del sistema", "voltaje",
         "bordspannung", "tension du systeme"}));
    params_.push_back(numeric("max_rimpull_kn", "kN", {50, 3000}, 2.0,
        {"maximum rimpull", "max rimpull", "rimpull", "tractive effort", "max tractive force",
         "fuerza de traccion", "rimpull maximo", "zugkraft", "effort de traction"}));
    params_.push_back(numeric("retarding_power_kw", "kW", {100, 10000}, 2.0,
        {"retarding power", "retarding capacity", "dynamic retarding", "retarder power",
         "potencia de retardo", "retarderleistung", "puissance de ralentissement"}));
    params_.push_back(count("forward_gear_count", {1, 12},
        {"forward gears", "number of forward gears", "forward speeds", "marchas adelante",
         "numero de marchas", "vorwartsgange", "rapports avant"},
        {"forward gears", "forward speeds", "speed forward", "forward", "marchas"}));

    for (auto& p : params_) {
        static const char* loading[] = {
            "operating_weight_kg", "engine_power_kw", "bucket_capacity_m3", "breakout_force_kn",
            "digging_depth_m", "max_reach_m", "fuel_tank_capacity_l", "engine_model"};
        static const char* haulage[] = {
            "operating_weight_kg", "empty_weight_kg", "payload_capacity_kg", "engine_power_kw",
            "max_speed_kph", "max_rimpull_kn", "tire_size", "fuel_tank_capacity_l", "engine_model"};
        p.core_loading = std::find(std::begin(loading), std::end(loading), p.name) != std::end(loading);
        p.core_haulage = std::find(std::begin(haulage), std::end(haulage), p.name) != std::end(haulage);
    }
}

const ParameterCatalog& ParameterCatalog::builtin() {
    static const ParameterCatalog catalog;
    return catalog;
}

const ParameterSpec* ParameterCatalog::find(std::string_view name) const {
    for (const auto& p : params_) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

std::vector<std::string> ParameterCatalog::core_parameters(EquipmentClass cls) const {
    std::vector<std::string> out;
    for (const auto& p : params_) {
        bool core = false;
        switch (cls) {
            case EquipmentClass::Loading:     core = p.core_loading; break;
            case EquipmentClass::Haulage:     core = p.core_haulage; break;
            case EquipmentClass::Unspecified: core = p.core_loading && p.core_haulage; break;
        }
        if (core) out.push_back(p.name);
    }
    return out;
}

EquipmentClass infer_equipment_class(const std::string& model,
                                     const std::vector<ExtractionCandidate>& candidates) {
    std::string lower;
    lower.reserve(model.size());
    for (char c : model) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    static const char* haul_words[] = {"truck", "hauler", "dump", "camion", "muldenkipper"};
    static const char* load_words[] = {"excavator", "shovel", "loader", "dozer", "dragline",
                                       "excavadora", "pala", "cargador", "bagger"};
    for (const char* w : haul_words) {
        if (lower.find(w) != std::string::npos) return EquipmentClass::Haulage;
    }
    for (const char* w : load_words) {
        if (lower.find(w) != std::string::npos) return EquipmentClass::Loading;
    }

    int haul = 0;
    int load = 0;
    for (const auto& c : candidates) {
        if (c.parameter == "payload_capacity_kg" || c.parameter == "max_rimpull_kn" ||
            c.parameter == "retarding_power_kw" || c.parameter == "empty_weight_kg") {
            ++haul;
        } else if (c.parameter == "bucket_capacity_m3" || c.parameter == "dipper_capacity_m3" ||
                   c.parameter == "digging_depth_m" || c.parameter == "breakout_force_kn") {
            ++load;
        }
    }
    if (haul > load) return EquipmentClass::Haulage;
    if (load > haul) return EquipmentClass::Loading;
    return EquipmentClass::Unspecified;
}

} // namespace MineSpec
