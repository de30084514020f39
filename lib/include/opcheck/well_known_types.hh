//
// Metadata names of the runtime types the builtin rules depend on
//

#pragma once

namespace opcheck::well_known_types {
    constexpr const char* SYSTEM_OBJECT = "System.Object";
    constexpr const char* SYSTEM_INTPTR = "System.IntPtr";
    constexpr const char* SYSTEM_UINTPTR = "System.UIntPtr";
    constexpr const char* SYSTEM_IDISPOSABLE = "System.IDisposable";
    constexpr const char* SYSTEM_RUNTIME_INTEROPSERVICES_HANDLEREF = "System.Runtime.InteropServices.HandleRef";

    constexpr const char* SYSTEM_NET_SECURITY_REMOTECERTIFICATEVALIDATIONCALLBACK =
        "System.Net.Security.RemoteCertificateValidationCallback";
    constexpr const char* SYSTEM_NET_SECURITY_SSLPOLICYERRORS = "System.Net.Security.SslPolicyErrors";
    constexpr const char* SYSTEM_SECURITY_CRYPTOGRAPHY_X509CERTIFICATES_X509CERTIFICATE =
        "System.Security.Cryptography.X509Certificates.X509Certificate";
    constexpr const char* SYSTEM_SECURITY_CRYPTOGRAPHY_X509CERTIFICATES_X509CHAIN =
        "System.Security.Cryptography.X509Certificates.X509Chain";
}
