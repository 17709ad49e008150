#pragma once

int cmd_tables(int argc, char** argv);
