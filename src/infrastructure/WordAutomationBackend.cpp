/**
 * @file WordAutomationBackend.cpp
 * @brief Late-bound IDispatch calls into Word: Documents.Open -> ExportAsFixedFormat -> Close -> Quit.
 */
#include "infrastructure/WordAutomationBackend.hpp"

#include "domain/ConversionResult.hpp"

#include <filesystem>
#include <iostream>

#if defined(_WIN32)
#include <cstdio>
#include <memory>
#include <vector>
#include <windows.h>
#include <objbase.h>
#include <oleauto.h>
#endif

namespace docxpdf::infrastructure {

#if defined(_WIN32)

namespace {

constexpr int kWdExportFormatPDF = 17;
constexpr int kWdDoNotSaveChanges = 0;

/** Per-call COM apartment; released on every exit path. */
class ComScope {
public:
    ComScope() : m_hr(::CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED)) {}
    ~ComScope() {
        if (SUCCEEDED(m_hr)) ::CoUninitialize();
    }
    ComScope(const ComScope&) = delete;
    ComScope& operator=(const ComScope&) = delete;

    // RPC_E_CHANGED_MODE: the thread already has a multithreaded apartment, which is usable.
    bool usable() const { return SUCCEEDED(m_hr) || m_hr == RPC_E_CHANGED_MODE; }
    HRESULT code() const { return m_hr; }

private:
    HRESULT m_hr;
};

struct DispatchReleaser {
    void operator()(IDispatch* p) const {
        if (p) p->Release();
    }
};
using DispatchPtr = std::unique_ptr<IDispatch, DispatchReleaser>;

std::string HResultText(HRESULT hr) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "0x%08lX", static_cast<unsigned long>(hr));
    return buffer;
}

[[noreturn]] void Fail(const std::string& step, HRESULT hr) {
    throw domain::ConversionError(domain::FailureKind::ConversionEngineError,
                                  "Word automation failed at " + step + " (HRESULT " + HResultText(hr) + ")");
}

/** Calls a member by name. args are given in natural order. */
HRESULT Invoke(IDispatch* target, const wchar_t* member, WORD flags, std::vector<VARIANT> args, VARIANT* result) {
    DISPID dispid;
    LPOLESTR name = const_cast<LPOLESTR>(member);
    HRESULT hr = target->GetIDsOfNames(IID_NULL, &name, 1, LOCALE_USER_DEFAULT, &dispid);
    if (FAILED(hr)) return hr;

    // IDispatch expects arguments in reverse order.
    std::vector<VARIANT> reversed(args.rbegin(), args.rend());
    DISPPARAMS params{};
    params.cArgs = static_cast<UINT>(reversed.size());
    params.rgvarg = reversed.empty() ? nullptr : reversed.data();

    DISPID putId = DISPID_PROPERTYPUT;
    if (flags & DISPATCH_PROPERTYPUT) {
        params.cNamedArgs = 1;
        params.rgdispidNamedArgs = &putId;
    }

    if (result) ::VariantInit(result);
    return target->Invoke(dispid, IID_NULL, LOCALE_USER_DEFAULT, flags, &params, result, nullptr, nullptr);
}

VARIANT MakeBool(bool value) {
    VARIANT v;
    ::VariantInit(&v);
    v.vt = VT_BOOL;
    v.boolVal = value ? VARIANT_TRUE : VARIANT_FALSE;
    return v;
}

VARIANT MakeInt(int value) {
    VARIANT v;
    ::VariantInit(&v);
    v.vt = VT_I4;
    v.lVal = value;
    return v;
}

class Bstr {
public:
    explicit Bstr(const std::wstring& s) : m_value(::SysAllocString(s.c_str())) {}
    ~Bstr() { ::SysFreeString(m_value); }
    Bstr(const Bstr&) = delete;
    Bstr& operator=(const Bstr&) = delete;

    VARIANT variant() const {
        VARIANT v;
        ::VariantInit(&v);
        v.vt = VT_BSTR;
        v.bstrVal = m_value;
        return v;
    }

private:
    BSTR m_value;
};

DispatchPtr TakeDispatch(VARIANT& v, const std::string& step) {
    if (v.vt != VT_DISPATCH || !v.pdispVal) {
        ::VariantClear(&v);
        Fail(step, E_UNEXPECTED);
    }
    return DispatchPtr(v.pdispVal); // Ownership moves out of the VARIANT.
}

/** Quits the Word instance when the conversion is done or has failed. */
class WordSession {
public:
    explicit WordSession(DispatchPtr app) : m_app(std::move(app)) {}
    ~WordSession() {
        if (m_app) {
            VARIANT ignored;
            Invoke(m_app.get(), L"Quit", DISPATCH_METHOD, {MakeInt(kWdDoNotSaveChanges)}, &ignored);
            ::VariantClear(&ignored);
        }
    }
    IDispatch* get() const { return m_app.get(); }

private:
    DispatchPtr m_app;
};

class OpenDocument {
public:
    explicit OpenDocument(DispatchPtr doc) : m_doc(std::move(doc)) {}
    ~OpenDocument() {
        if (m_doc) {
            VARIANT ignored;
            Invoke(m_doc.get(), L"Close", DISPATCH_METHOD, {MakeInt(kWdDoNotSaveChanges)}, &ignored);
            ::VariantClear(&ignored);
        }
    }
    IDispatch* get() const { return m_doc.get(); }

private:
    DispatchPtr m_doc;
};

} // namespace

bool WordAutomationBackend::IsAvailable() {
    ComScope com;
    if (!com.usable()) return false;
    CLSID clsid;
    return SUCCEEDED(::CLSIDFromProgID(L"Word.Application", &clsid));
}

std::string WordAutomationBackend::convert(const std::string& inputPath, const std::string& outputPath) {
    ComScope com;
    if (!com.usable()) {
        Fail("CoInitializeEx", com.code());
    }

    CLSID clsid;
    HRESULT hr = ::CLSIDFromProgID(L"Word.Application", &clsid);
    if (FAILED(hr)) Fail("CLSIDFromProgID", hr);

    IDispatch* rawApp = nullptr;
    hr = ::CoCreateInstance(clsid, nullptr, CLSCTX_LOCAL_SERVER, IID_IDispatch, reinterpret_cast<void**>(&rawApp));
    if (FAILED(hr)) Fail("CoCreateInstance", hr);
    WordSession word(DispatchPtr{rawApp});

    VARIANT ignored;
    hr = Invoke(word.get(), L"Visible", DISPATCH_PROPERTYPUT, {MakeBool(false)}, nullptr);
    if (FAILED(hr)) Fail("Application.Visible", hr);
    hr = Invoke(word.get(), L"DisplayAlerts", DISPATCH_PROPERTYPUT, {MakeInt(0)}, nullptr);
    if (FAILED(hr)) Fail("Application.DisplayAlerts", hr);

    VARIANT docsVar;
    hr = Invoke(word.get(), L"Documents", DISPATCH_PROPERTYGET, {}, &docsVar);
    if (FAILED(hr)) Fail("Application.Documents", hr);
    DispatchPtr documents = TakeDispatch(docsVar, "Application.Documents");

    namespace fs = std::filesystem;
    Bstr inputName(fs::absolute(inputPath).wstring());
    Bstr outputName(fs::absolute(outputPath).wstring());

    // Open(FileName, ConfirmConversions, ReadOnly)
    VARIANT docVar;
    hr = Invoke(documents.get(), L"Open", DISPATCH_METHOD,
                {inputName.variant(), MakeBool(false), MakeBool(true)}, &docVar);
    if (FAILED(hr)) Fail("Documents.Open", hr);
    OpenDocument document(TakeDispatch(docVar, "Documents.Open"));

    // ExportAsFixedFormat(OutputFileName, ExportFormat)
    hr = Invoke(document.get(), L"ExportAsFixedFormat", DISPATCH_METHOD,
                {outputName.variant(), MakeInt(kWdExportFormatPDF)}, &ignored);
    ::VariantClear(&ignored);
    if (FAILED(hr)) Fail("Document.ExportAsFixedFormat", hr);

    std::cout << "[WordAutomation] Exported " << outputPath << std::endl;
    return outputPath;
}

#else

bool WordAutomationBackend::IsAvailable() {
    return false;
}

std::string WordAutomationBackend::convert(const std::string& inputPath, const std::string&) {
    std::cerr << "[WordAutomation] Requested for " << inputPath << " on a non-Windows host" << std::endl;
    throw domain::ConversionError(domain::FailureKind::ConversionEngineError,
                                  "Microsoft Word automation is only available on Windows");
}

#endif

} // namespace docxpdf::infrastructure
