#pragma once

int cmd_validate(int argc, char** argv);
