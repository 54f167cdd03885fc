#include "core/log.hpp"
#include "core/time.hpp"
#include "timecode/timecode.hpp"
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitParse = 2;
constexpr int kExitRange = 3;

void usage() {
    std::cout << "Usage: em_tc [--json] [--verbose] <HH:MM:SS:FF@RATE> [(+|-) <HH:MM:SS:FF@RATE> | * <factor>]\n"
              << "       em_tc [--json] [--verbose] --convert <HH:MM:SS:FF@RATE> <RATE>\n"
              << "RATE is N or N/D (e.g. 24, 25, 24000/1001)\n";
}

// "24" or "30000/1001"
bool parse_rate(const std::string& text, em::TimeRational& out) {
    auto slash = text.find('/');
    std::string num_s = text.substr(0, slash);
    std::string den_s = slash == std::string::npos ? "1" : text.substr(slash + 1);
    int64_t num = 0;
    int32_t den = 0;
    auto r1 = std::from_chars(num_s.data(), num_s.data() + num_s.size(), num);
    auto r2 = std::from_chars(den_s.data(), den_s.data() + den_s.size(), den);
    if(r1.ec != std::errc() || r1.ptr != num_s.data() + num_s.size()) return false;
    if(r2.ec != std::errc() || r2.ptr != den_s.data() + den_s.size()) return false;
    out = em::TimeRational{num, den};
    return true;
}

// "01:00:00:00@24"
em::timecode::Timecode parse_operand(const std::string& text) {
    auto at = text.find('@');
    if(at == std::string::npos) {
        throw em::timecode::ParseError("operand '" + text + "' is missing '@RATE'");
    }
    em::TimeRational rate;
    if(!parse_rate(text.substr(at + 1), rate)) {
        throw em::timecode::ParseError("bad frame rate in '" + text + "'");
    }
    return em::timecode::Timecode::parse(text.substr(0, at), rate);
}

double parse_factor(const std::string& text) {
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if(text.empty() || end != text.c_str() + text.size()) {
        throw em::timecode::ParseError("bad scale factor '" + text + "'");
    }
    return v;
}

em::timecode::Timecode evaluate(const std::vector<std::string>& args, bool convert) {
    using em::timecode::Timecode;
    if(convert) {
        if(args.size() != 2) throw std::invalid_argument("--convert takes a timecode and a rate");
        em::TimeRational rate;
        if(!parse_rate(args[1], rate)) throw em::timecode::ParseError("bad frame rate '" + args[1] + "'");
        return parse_operand(args[0]).converted_to(rate);
    }
    if(args.size() == 1) return parse_operand(args[0]);
    if(args.size() != 3) throw std::invalid_argument("expected <tc> or <tc> <op> <operand>");

    Timecode lhs = parse_operand(args[0]);
    const std::string& op = args[1];
    if(op == "+") return lhs + parse_operand(args[2]);
    if(op == "-") return lhs - parse_operand(args[2]);
    if(op == "*" || op == "x") return lhs * parse_factor(args[2]);
    throw std::invalid_argument("unknown operator '" + op + "'");
}

} // namespace

int main(int argc, char** argv) {
    bool json = false;
    bool convert = false;
    std::vector<std::string> args;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a == "--json") { json = true; continue; }
        if(a == "--verbose") { em::log::set_level(em::log::Level::Debug); continue; }
        if(a == "--convert") { convert = true; continue; }
        if(a == "--help" || a == "-h") { usage(); return 0; }
        args.push_back(a);
    }
    em::log::set_json_mode(json);
    if(args.empty()) { usage(); return kExitUsage; }

    try {
        auto result = evaluate(args, convert);
        em::log::debug("em_tc result " + result.to_string());
        if(json) {
            std::ostringstream oss;
            oss << '{'
                << "\"timecode\":\"" << result.timecode() << "\","
                << "\"total_frames\":" << result.total_frames() << ','
                << "\"rate\":\"" << em::rate_to_string(result.rate()) << "\","
                << "\"hours\":" << result.hours() << ','
                << "\"minutes\":" << result.minutes() << ','
                << "\"seconds\":" << result.seconds() << ','
                << "\"frames\":" << result.frames()
                << '}';
            std::cout << oss.str() << std::endl;
        } else {
            std::cout << result.timecode() << " @ " << em::rate_to_string(result.rate()) << " fps"
                      << " (" << result.total_frames() << " frames)\n";
        }
    } catch(const em::timecode::ParseError& e) {
        em::log::error(std::string("Parse error: ") + e.what());
        return kExitParse;
    } catch(const em::timecode::RangeError& e) {
        em::log::error(std::string("Range error: ") + e.what());
        return kExitRange;
    } catch(const std::invalid_argument& e) {
        em::log::error(e.what());
        usage();
        return kExitUsage;
    }
    return 0;
}
