#include "hwident/probe.hpp"

#include "platform.hpp"

#if defined(HWIDENT_PLATFORM_WINDOWS)

#define _WIN32_DCOM
#include <comdef.h>
#include <wbemidl.h>
#include <windows.h>

#include "logging.hpp"

#include <memory>

namespace hwident {

namespace {

// Releases a COM interface on scope exit
template <typename T> struct ComRelease {
    void operator()(T* p) const {
        if (p != nullptr) {
            p->Release();
        }
    }
};

template <typename T> using ComPtr = std::unique_ptr<T, ComRelease<T>>;

// Initializes COM for the calling thread; uninitializes only if we initialized it
class ComApartment {
  public:
    ComApartment() : hr_(CoInitializeEx(nullptr, COINIT_MULTITHREADED)) {
        if (SUCCEEDED(hr_)) {
            // Fails harmlessly when the host already configured security
            CoInitializeSecurity(nullptr, -1, nullptr, nullptr, RPC_C_AUTHN_LEVEL_DEFAULT,
                                 RPC_C_IMP_LEVEL_IMPERSONATE, nullptr, EOAC_NONE, nullptr);
        }
    }
    ~ComApartment() {
        if (SUCCEEDED(hr_)) {
            CoUninitialize();
        }
    }

    ComApartment(const ComApartment&) = delete;
    ComApartment& operator=(const ComApartment&) = delete;

    // RPC_E_CHANGED_MODE: thread already has an apartment, COM is still usable
    [[nodiscard]] bool usable() const noexcept { return SUCCEEDED(hr_) || hr_ == RPC_E_CHANGED_MODE; }

  private:
    HRESULT hr_;
};

struct WmiProperty {
    const wchar_t* property;
    const char* key;
};

struct WmiClass {
    const wchar_t* query;
    std::vector<WmiProperty> properties;
};

const std::vector<WmiClass>& wmi_classes() {
    static const std::vector<WmiClass> classes = {
        {L"SELECT UUID, IdentifyingNumber, Name, Vendor FROM Win32_ComputerSystemProduct",
         {{L"UUID", keys::SYSTEM_UUID},
          {L"IdentifyingNumber", keys::PRODUCT_SERIAL},
          {L"Name", keys::PRODUCT_NAME},
          {L"Vendor", keys::MANUFACTURER}}},
        {L"SELECT SerialNumber FROM Win32_BaseBoard", {{L"SerialNumber", keys::BOARD_SERIAL}}},
        {L"SELECT SerialNumber FROM Win32_SystemEnclosure",
         {{L"SerialNumber", keys::CHASSIS_SERIAL}}},
        {L"SELECT SerialNumber FROM Win32_BIOS", {{L"SerialNumber", keys::BIOS_SERIAL}}},
    };
    return classes;
}

std::string bstr_to_utf8(BSTR value) {
    if (value == nullptr) {
        return "";
    }
    int length = static_cast<int>(SysStringLen(value));
    if (length == 0) {
        return "";
    }
    int size = WideCharToMultiByte(CP_UTF8, 0, value, length, nullptr, 0, nullptr, nullptr);
    if (size <= 0) {
        return "";
    }
    std::string result(static_cast<size_t>(size), '\0');
    WideCharToMultiByte(CP_UTF8, 0, value, length, result.data(), size, nullptr, nullptr);
    return result;
}

LONG remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<LONG>(left.count()) : 0;
}

void query_class(IWbemServices* services, const WmiClass& wmi_class,
                 std::chrono::steady_clock::time_point deadline, ProbeReport& report) {
    IEnumWbemClassObject* raw_enum = nullptr;
    HRESULT hr = services->ExecQuery(bstr_t(L"WQL"), bstr_t(wmi_class.query),
                                     WBEM_FLAG_FORWARD_ONLY | WBEM_FLAG_RETURN_IMMEDIATELY,
                                     nullptr, &raw_enum);
    ComPtr<IEnumWbemClassObject> enumerator(raw_enum);
    if (FAILED(hr) || !enumerator) {
        LOG_DBG << "WMI query failed, hr=" << std::hex << hr;
        return;
    }

    IWbemClassObject* raw_obj = nullptr;
    ULONG returned = 0;
    hr = enumerator->Next(remaining_ms(deadline), 1, &raw_obj, &returned);
    ComPtr<IWbemClassObject> object(raw_obj);

    if (hr == WBEM_S_TIMEDOUT) {
        LOG_WAR << "WMI enumeration timed out";
        for (const auto& prop : wmi_class.properties) {
            report[prop.key] = ProbeOutcome::unavailable(ErrorCode::Timeout);
        }
        return;
    }
    if (FAILED(hr) || returned == 0 || !object) {
        return;
    }

    for (const auto& prop : wmi_class.properties) {
        VARIANT value;
        VariantInit(&value);
        if (SUCCEEDED(object->Get(prop.property, 0, &value, nullptr, nullptr))) {
            if (value.vt == VT_BSTR) {
                report[prop.key] = ProbeOutcome::of(bstr_to_utf8(value.bstrVal));
            }
        }
        VariantClear(&value);
    }
}

}  // namespace

WmiProbe::WmiProbe(std::chrono::milliseconds timeout) : timeout_(timeout) {}

std::vector<std::string> WmiProbe::fields() const {
    std::vector<std::string> result;
    for (const auto& wmi_class : wmi_classes()) {
        for (const auto& prop : wmi_class.properties) {
            result.emplace_back(prop.key);
        }
    }
    return result;
}

ProbeReport WmiProbe::probe() {
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    ProbeReport report = unavailable_report(fields(), ErrorCode::SourceUnavailable);

    ComApartment apartment;
    if (!apartment.usable()) {
        LOG_DBG << "COM initialization failed";
        return report;
    }

    IWbemLocator* raw_locator = nullptr;
    HRESULT hr = CoCreateInstance(CLSID_WbemLocator, nullptr, CLSCTX_INPROC_SERVER,
                                  IID_IWbemLocator, reinterpret_cast<LPVOID*>(&raw_locator));
    ComPtr<IWbemLocator> locator(raw_locator);
    if (FAILED(hr) || !locator) {
        LOG_DBG << "WbemLocator unavailable, hr=" << std::hex << hr;
        return report;
    }

    IWbemServices* raw_services = nullptr;
    hr = locator->ConnectServer(bstr_t(L"ROOT\\CIMV2"), nullptr, nullptr, nullptr,
                                WBEM_FLAG_CONNECT_USE_MAX_WAIT, nullptr, nullptr, &raw_services);
    ComPtr<IWbemServices> services(raw_services);
    if (FAILED(hr) || !services) {
        LOG_DBG << "WMI connect failed, hr=" << std::hex << hr;
        return report;
    }

    hr = CoSetProxyBlanket(services.get(), RPC_C_AUTHN_WINNT, RPC_C_AUTHZ_NONE, nullptr,
                           RPC_C_AUTHN_LEVEL_CALL, RPC_C_IMP_LEVEL_IMPERSONATE, nullptr,
                           EOAC_NONE);
    if (FAILED(hr)) {
        LOG_DBG << "CoSetProxyBlanket failed, hr=" << std::hex << hr;
        return report;
    }

    for (const auto& wmi_class : wmi_classes()) {
        if (remaining_ms(deadline) == 0) {
            for (const auto& prop : wmi_class.properties) {
                report[prop.key] = ProbeOutcome::unavailable(ErrorCode::Timeout);
            }
            continue;
        }
        query_class(services.get(), wmi_class, deadline, report);
    }

    return report;
}

}  // namespace hwident

#endif
