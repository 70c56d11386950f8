extern "C" {
#include <bacnet/bacdef.h>
#include <bacnet/bacenum.h>
#include <bacnet/iam.h>
#include <bacnet/whois.h>
}

#include <array>
#include <cstdint>
#include <iostream>

int main()
{
    std::array<std::uint8_t, MAX_APDU> apdu{};

    const int whoIsLength = whois_encode_apdu(apdu.data(), 100, 200);
    if (whoIsLength <= 2)
    {
        std::cerr << "bacnet-stack detected but whois_encode_apdu failed." << std::endl;
        return 1;
    }
    int32_t low = -1;
    int32_t high = -1;
    if (whois_decode_service_request(&apdu[2], static_cast<unsigned>(whoIsLength - 2), &low, &high) <= 0 ||
        low != 100 || high != 200)
    {
        std::cerr << "bacnet-stack detected but Who-Is limits did not survive decoding." << std::endl;
        return 1;
    }

    const int iAmLength = iam_encode_apdu(apdu.data(), 1234, MAX_APDU, SEGMENTATION_NONE, 260);
    uint32_t deviceId = 0;
    unsigned maxApdu = 0;
    int segmentation = -1;
    uint16_t vendorId = 0;
    if (iAmLength <= 2 || iam_decode_service_request(&apdu[2], &deviceId, &maxApdu, &segmentation, &vendorId) <= 0 ||
        deviceId != 1234 || vendorId != 260)
    {
        std::cerr << "bacnet-stack detected but I-Am did not survive decoding." << std::endl;
        return 1;
    }

    std::cout << "bacnet-stack library detected and Who-Is/I-Am encode correctly." << std::endl;
    return 0;
}
