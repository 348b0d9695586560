// SPDX-License-Identifier: Apache-2.0

#include "SqlError.hpp"

#include <algorithm>

SqlErrorInfo SqlErrorInfo::fromHandle(SQLSMALLINT handleType, SQLHANDLE handle)
{
    SqlErrorInfo info {};
    info.message = std::string(1024, '\0');

    SQLSMALLINT msgLen {};
    SQLRETURN const sqlResult = SQLGetDiagRecA(handleType,
                                               handle,
                                               1,
                                               (SQLCHAR*) info.sqlState.data(),
                                               &info.nativeErrorCode,
                                               (SQLCHAR*) info.message.data(),
                                               (SQLSMALLINT) info.message.size(),
                                               &msgLen);
    if (!SQL_SUCCEEDED(sqlResult))
    {
        info.message.clear();
        return info;
    }

    info.message.resize(std::min<size_t>(static_cast<size_t>(msgLen), info.message.size()));
    return info;
}
