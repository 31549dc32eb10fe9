/*!
    \file "tftp.hpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)

    This is the general use header for the tftpkit TFTP client and server.
*/


#ifndef TFTP_HPP__48D147BD_2A10_45D9_9245_2E3E4278341B__INCLUDED
#define TFTP_HPP__48D147BD_2A10_45D9_9245_2E3E4278341B__INCLUDED


#pragma once


#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/tftp_error.hpp>
#include <tftpkit/tftp/packet.hpp>
#include <tftpkit/tftp/options.hpp>
#include <tftpkit/tftp/client_config.hpp>
#include <tftpkit/tftp/server_config.hpp>
#include <tftpkit/tftp/tftp_client.hpp>
#include <tftpkit/tftp/tftp_server.hpp>


#endif // #ifndef TFTP_HPP__48D147BD_2A10_45D9_9245_2E3E4278341B__INCLUDED


/*
    End of "tftp.hpp"
*/
