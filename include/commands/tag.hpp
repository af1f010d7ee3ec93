#pragma once

int cmd_tag(int argc, char** argv);
