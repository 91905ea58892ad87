#pragma once

#include <string_view>

namespace Courier
{
    enum class TransferState
    {
        Validating,
        TransferringTemp,
        Renaming,
        TransferringDirect,
        Done,
        Failed,
    };

    constexpr std::string_view transferStateToString(TransferState state)
    {
        switch (state)
        {
            case TransferState::Validating:
                return "Validating";
            case TransferState::TransferringTemp:
                return "TransferringTemp";
            case TransferState::Renaming:
                return "Renaming";
            case TransferState::TransferringDirect:
                return "TransferringDirect";
            case TransferState::Done:
                return "Done";
            case TransferState::Failed:
                return "Failed";
        }
        return "INVALID_ENUM_VALUE";
    }
}
