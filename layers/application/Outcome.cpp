#include "Outcome.h"

#include <sstream>

namespace application {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

bool isDeviceFound(const Outcome& outcome) {
    return !std::holds_alternative<NoResponse>(outcome);
}

bool isSuccess(const Outcome& outcome) {
    return std::holds_alternative<Success>(outcome);
}

std::string outcomeStatus(const Outcome& outcome) {
    return std::visit(Overloaded{
                          [](const Success&) { return std::string("success"); },
                          [](const DeviceError&) { return std::string("device_error"); },
                          [](const GatewayError&) { return std::string("gateway_error"); },
                          [](const NoResponse&) { return std::string("no_response"); },
                      },
                      outcome);
}

std::string describeOutcome(const Outcome& outcome) {
    return std::visit(Overloaded{
                          [](const Success& s) {
                              std::ostringstream out;
                              out << "Success (" << s.rawBytes.size() << " bytes)";
                              return out.str();
                          },
                          [](const DeviceError& e) {
                              return "Exception Code " + std::to_string(e.exceptionCode);
                          },
                          [](const GatewayError& e) {
                              return "Gateway Error " + std::to_string(e.code);
                          },
                          [](const NoResponse&) { return std::string("No response"); },
                      },
                      outcome);
}

} // namespace application
