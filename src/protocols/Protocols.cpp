/*
 *
 *    Copyright (c) 2023 Project CHIP Authors
 *    All rights reserved.
 *
 *    Licensed under the Apache License, Version 2.0 (the "License");
 *    you may not use this file except in compliance with the License.
 *    You may obtain a copy of the License at
 *
 *        http://www.apache.org/licenses/LICENSE-2.0
 *
 *    Unless required by applicable law or agreed to in writing, software
 *    distributed under the License is distributed on an "AS IS" BASIS,
 *    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *    See the License for the specific language governing permissions and
 *    limitations under the License.
 */

#include <protocols/Protocols.h>

#include <protocols/echo/Echo.h>
#include <protocols/interaction_model/Constants.h>
#include <protocols/secure_channel/Constants.h>

namespace tether {
namespace Protocols {

namespace {

const char * SecureChannelMessageName(uint8_t msgType)
{
    switch (static_cast<SecureChannel::MsgType>(msgType))
    {
    case SecureChannel::MsgType::MsgCounterSyncReq:
        return "MsgCounterSyncReq";
    case SecureChannel::MsgType::MsgCounterSyncRsp:
        return "MsgCounterSyncRsp";
    case SecureChannel::MsgType::StandaloneAck:
        return "StandaloneAck";
    case SecureChannel::MsgType::PBKDFParamRequest:
        return "PBKDFParamRequest";
    case SecureChannel::MsgType::PBKDFParamResponse:
        return "PBKDFParamResponse";
    case SecureChannel::MsgType::PASE_Pake1:
        return "PASE_Pake1";
    case SecureChannel::MsgType::PASE_Pake2:
        return "PASE_Pake2";
    case SecureChannel::MsgType::PASE_Pake3:
        return "PASE_Pake3";
    case SecureChannel::MsgType::CASE_Sigma1:
        return "CASE_Sigma1";
    case SecureChannel::MsgType::CASE_Sigma2:
        return "CASE_Sigma2";
    case SecureChannel::MsgType::CASE_Sigma3:
        return "CASE_Sigma3";
    case SecureChannel::MsgType::CASE_Sigma2Resume:
        return "CASE_Sigma2Resume";
    case SecureChannel::MsgType::StatusReport:
        return "StatusReport";
    }
    return "----";
}

const char * InteractionModelMessageName(uint8_t msgType)
{
    switch (static_cast<InteractionModel::MsgType>(msgType))
    {
    case InteractionModel::MsgType::StatusResponse:
        return "StatusResponse";
    case InteractionModel::MsgType::ReadRequest:
        return "ReadRequest";
    case InteractionModel::MsgType::SubscribeRequest:
        return "SubscribeRequest";
    case InteractionModel::MsgType::SubscribeResponse:
        return "SubscribeResponse";
    case InteractionModel::MsgType::ReportData:
        return "ReportData";
    case InteractionModel::MsgType::WriteRequest:
        return "WriteRequest";
    case InteractionModel::MsgType::WriteResponse:
        return "WriteResponse";
    case InteractionModel::MsgType::InvokeCommandRequest:
        return "InvokeCommandRequest";
    case InteractionModel::MsgType::InvokeCommandResponse:
        return "InvokeCommandResponse";
    case InteractionModel::MsgType::TimedRequest:
        return "TimedRequest";
    }
    return "----";
}

} // namespace

const char * GetProtocolName(Id protocol)
{
    if (protocol == SecureChannel::Id)
    {
        return "SecureChannel";
    }
    if (protocol == InteractionModel::Id)
    {
        return "IM";
    }
    if (protocol == BDX::Id)
    {
        return "BDX";
    }
    if (protocol == UserDirectedCommissioning::Id)
    {
        return "UDC";
    }
    if (protocol == Echo::Id)
    {
        return "Echo";
    }
    return "Unknown";
}

const char * GetMessageTypeName(Id protocol, uint8_t msgType)
{
    if (protocol == SecureChannel::Id)
    {
        return SecureChannelMessageName(msgType);
    }
    if (protocol == InteractionModel::Id)
    {
        return InteractionModelMessageName(msgType);
    }
    if (protocol == Echo::Id)
    {
        switch (static_cast<Echo::MsgType>(msgType))
        {
        case Echo::MsgType::EchoRequest:
            return "EchoRequest";
        case Echo::MsgType::EchoResponse:
            return "EchoResponse";
        }
    }
    return "----";
}

} // namespace Protocols
} // namespace tether
